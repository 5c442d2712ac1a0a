/**
 * @file metrics.h
 * @brief Transfer metrics reporting
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef NEOLOAD_METRICS_H
#define NEOLOAD_METRICS_H

#include <cstdint>
#include <memory>
#include <string>

namespace neoload {
namespace metrics {

constexpr const char* OBJ_PUT_TOTAL = "neofs_obj_put_total";
constexpr const char* OBJ_PUT_FAILS = "neofs_obj_put_fails";
constexpr const char* OBJ_PUT_DURATION = "neofs_obj_put_duration";
constexpr const char* OBJ_GET_TOTAL = "neofs_obj_get_total";
constexpr const char* OBJ_GET_FAILS = "neofs_obj_get_fails";
constexpr const char* OBJ_GET_DURATION = "neofs_obj_get_duration";

} // namespace metrics

/**
 * @brief Metrics collector
 *
 * Implementations must not throw and must not block the transfer path
 * for longer than a short critical section.
 */
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    /**
     * @param name Counter or trend name
     * @param value Increment, or duration in milliseconds for *_duration
     */
    virtual void Report(const std::string& name, double value) = 0;
    virtual void ReportDataSent(uint64_t bytes) = 0;
    virtual void ReportDataReceived(uint64_t bytes) = 0;
};

/**
 * @brief Thread-safe aggregating sink backed by an OpenTelemetry meter
 *
 * Names ending in "_duration" are recorded into histograms, everything
 * else into monotonic counters. Instruments are created on first use.
 * Reads collect a cumulative snapshot through an in-process reader.
 */
class MetricsRegistry : public MetricsSink {
public:
    struct Series {
        uint64_t count = 0;
        double sum = 0;
        double min = 0;
        double max = 0;

        double Average() const { return count ? sum / static_cast<double>(count) : 0; }
    };

    MetricsRegistry();
    ~MetricsRegistry() override;

    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    void Report(const std::string& name, double value) override;
    void ReportDataSent(uint64_t bytes) override;
    void ReportDataReceived(uint64_t bytes) override;

    /**
     * @return Accumulated counter value (0 if never reported)
     */
    uint64_t Counter(const std::string& name) const;

    /**
     * @return Aggregate for a duration trend (all zero if never reported)
     */
    Series Trend(const std::string& name) const;

    uint64_t DataSent() const;
    uint64_t DataReceived() const;

    /**
     * @brief One line per instrument plus data totals
     */
    std::string Summary() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace neoload

#endif // NEOLOAD_METRICS_H
