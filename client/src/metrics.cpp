/**
 * @file metrics.cpp
 * @brief Aggregating metrics sink
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/client/metrics.h"
#include <opentelemetry/context/context.h>
#include <opentelemetry/metrics/meter.h>
#include <opentelemetry/metrics/meter_provider.h>
#include <opentelemetry/metrics/sync_instruments.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/nostd/variant.h>
#include <opentelemetry/sdk/metrics/data/metric_data.h>
#include <opentelemetry/sdk/metrics/data/point_data.h>
#include <opentelemetry/sdk/metrics/export/metric_producer.h>
#include <opentelemetry/sdk/metrics/instruments.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/meter_provider_factory.h>
#include <opentelemetry/sdk/metrics/metric_reader.h>
#include <chrono>
#include <iomanip>
#include <map>
#include <mutex>
#include <sstream>

namespace neoload {

namespace {

namespace otel_api = opentelemetry::metrics;
namespace otel_sdk = opentelemetry::sdk::metrics;
namespace nostd = opentelemetry::nostd;

constexpr const char* METER_NAME = "neoload";
constexpr const char* METER_VERSION = "0.1.0";
constexpr const char* DATA_SENT = "data_sent";
constexpr const char* DATA_RECEIVED = "data_received";
constexpr const char* DURATION_SUFFIX = "_duration";

using CounterPtr = nostd::shared_ptr<otel_api::Counter<uint64_t>>;
using HistogramPtr = nostd::shared_ptr<otel_api::Histogram<double>>;

bool IsDuration(const std::string& name) {
    const std::string suffix(DURATION_SUFFIX);
    return name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

double AsDouble(const otel_sdk::ValueType& value) {
    if (nostd::holds_alternative<double>(value)) {
        return nostd::get<double>(value);
    }
    return static_cast<double>(nostd::get<int64_t>(value));
}

// Pull-only reader; Collect() is driven by the registry's accessors
class SnapshotReader : public otel_sdk::MetricReader {
public:
    otel_sdk::AggregationTemporality GetAggregationTemporality(
        otel_sdk::InstrumentType) const noexcept override {
        return otel_sdk::AggregationTemporality::kCumulative;
    }

private:
    bool OnForceFlush(std::chrono::microseconds) noexcept override { return true; }
    bool OnShutDown(std::chrono::microseconds) noexcept override { return true; }
};

struct Snapshot {
    std::map<std::string, uint64_t> counters;
    std::map<std::string, MetricsRegistry::Series> trends;
};

} // anonymous namespace

class MetricsRegistry::Impl {
public:
    Impl() : reader_(std::make_shared<SnapshotReader>()) {
        std::shared_ptr<otel_api::MeterProvider> provider = otel_sdk::MeterProviderFactory::Create();
        dynamic_cast<otel_sdk::MeterProvider&>(*provider).AddMetricReader(reader_);
        provider_ = std::move(provider);
        meter_ = provider_->GetMeter(METER_NAME, METER_VERSION);
    }

    void Add(const std::string& name, uint64_t value) {
        CounterFor(name)->Add(value);
    }

    void Record(const std::string& name, double value) {
        HistogramFor(name)->Record(value, opentelemetry::context::Context{});
    }

    Snapshot Collect() const {
        Snapshot snapshot;
        reader_->Collect([&snapshot](otel_sdk::ResourceMetrics& data) {
            for (const auto& scope : data.scope_metric_data_) {
                for (const auto& metric : scope.metric_data_) {
                    const std::string& name = metric.instrument_descriptor.name_;
                    for (const auto& point : metric.point_data_attr_) {
                        if (nostd::holds_alternative<otel_sdk::SumPointData>(point.point_data)) {
                            const auto& sum = nostd::get<otel_sdk::SumPointData>(point.point_data);
                            snapshot.counters[name] += static_cast<uint64_t>(AsDouble(sum.value_));
                        } else if (nostd::holds_alternative<otel_sdk::HistogramPointData>(point.point_data)) {
                            const auto& hist = nostd::get<otel_sdk::HistogramPointData>(point.point_data);
                            if (hist.count_ == 0) {
                                continue;
                            }
                            Series& series = snapshot.trends[name];
                            series.count = hist.count_;
                            series.sum = AsDouble(hist.sum_);
                            series.min = AsDouble(hist.min_);
                            series.max = AsDouble(hist.max_);
                        }
                    }
                }
            }
            return true;
        });
        return snapshot;
    }

private:
    CounterPtr CounterFor(const std::string& name) {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = counters_.find(name);
        if (it == counters_.end()) {
            it = counters_.emplace(name, CounterPtr(meter_->CreateUInt64Counter(name))).first;
        }
        return it->second;
    }

    HistogramPtr HistogramFor(const std::string& name) {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = histograms_.find(name);
        if (it == histograms_.end()) {
            it = histograms_.emplace(name, HistogramPtr(meter_->CreateDoubleHistogram(name, "", "ms"))).first;
        }
        return it->second;
    }

    // Destroyed in reverse order: instruments, then the meter, then the provider
    std::shared_ptr<otel_api::MeterProvider> provider_;
    std::shared_ptr<SnapshotReader> reader_;
    nostd::shared_ptr<otel_api::Meter> meter_;
    std::mutex mu_;
    std::map<std::string, CounterPtr> counters_;
    std::map<std::string, HistogramPtr> histograms_;
};

MetricsRegistry::MetricsRegistry() : impl_(std::make_unique<Impl>()) {}

MetricsRegistry::~MetricsRegistry() = default;

void MetricsRegistry::Report(const std::string& name, double value) {
    if (IsDuration(name)) {
        impl_->Record(name, value);
    } else if (value > 0) {
        impl_->Add(name, static_cast<uint64_t>(value));
    }
}

void MetricsRegistry::ReportDataSent(uint64_t bytes) {
    impl_->Add(DATA_SENT, bytes);
}

void MetricsRegistry::ReportDataReceived(uint64_t bytes) {
    impl_->Add(DATA_RECEIVED, bytes);
}

uint64_t MetricsRegistry::Counter(const std::string& name) const {
    Snapshot snapshot = impl_->Collect();
    auto it = snapshot.counters.find(name);
    return it == snapshot.counters.end() ? 0 : it->second;
}

MetricsRegistry::Series MetricsRegistry::Trend(const std::string& name) const {
    Snapshot snapshot = impl_->Collect();
    auto it = snapshot.trends.find(name);
    return it == snapshot.trends.end() ? Series{} : it->second;
}

uint64_t MetricsRegistry::DataSent() const {
    return Counter(DATA_SENT);
}

uint64_t MetricsRegistry::DataReceived() const {
    return Counter(DATA_RECEIVED);
}

std::string MetricsRegistry::Summary() const {
    Snapshot snapshot = impl_->Collect();
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3);
    for (const auto& [name, value] : snapshot.counters) {
        if (name == DATA_SENT || name == DATA_RECEIVED) {
            continue;
        }
        ss << std::left << std::setw(26) << name << " count=" << value << "\n";
    }
    for (const auto& [name, s] : snapshot.trends) {
        ss << std::left << std::setw(26) << name << " count=" << s.count << " sum=" << s.sum
           << " min=" << s.min << " avg=" << s.Average() << " max=" << s.max << "\n";
    }
    ss << std::left << std::setw(26) << DATA_SENT << " bytes=" << snapshot.counters[DATA_SENT] << "\n";
    ss << std::left << std::setw(26) << DATA_RECEIVED << " bytes=" << snapshot.counters[DATA_RECEIVED] << "\n";
    return ss.str();
}

} // namespace neoload
