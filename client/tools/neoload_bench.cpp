/**
 * @file neoload_bench.cpp
 * @brief Multi-threaded PUT / GET workload against the in-process store
 *
 * Copyright 2025 neoload contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "neoload/client/bench_config.h"
#include "neoload/client/client.h"
#include "neoload/client/loopback_store.h"
#include "neoload/client/metrics.h"
#include "neoload/common/crypto.h"
#include "neoload/common/limits.h"
#include <glog/logging.h>
#include <atomic>
#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace neoload;

void PrintUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Runs a PUT, GET or prepared-PUT workload and prints transfer metrics.\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE         JSON workload configuration\n"
              << "  --mode MODE           Override mode: put, get or prepared\n"
              << "  --help                Show this help message\n"
              << "\n"
              << "Example configuration:\n"
              << "  {\"mode\": \"prepared\", \"threads\": 4, \"iterations\": 250,\n"
              << "   \"payload_size\": 131072, \"buffer_size\": 65536,\n"
              << "   \"attributes\": {\"Scenario\": \"bench\"}}\n"
              << std::endl;
}

std::unique_ptr<Context> NewContext(const BenchConfig& config) {
    if (config.timeout_ms > 0) {
        return std::make_unique<Context>(std::chrono::milliseconds(config.timeout_ms));
    }
    return std::make_unique<Context>();
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;

    std::string config_file;
    std::string mode_override;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file = argv[++i];
        } else if (std::strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            mode_override = argv[++i];
        } else {
            LOG(ERROR) << "Unknown option: " << argv[i];
            PrintUsage(argv[0]);
            return 1;
        }
    }

    BenchConfig config;
    std::shared_ptr<MetricsRegistry> metrics;
    std::shared_ptr<LoopbackStore> store;
    std::unique_ptr<Client> client;
    std::unique_ptr<PreparedObject> prepared;
    std::vector<std::string> object_ids;
    std::vector<uint8_t> payload;

    try {
        if (!config_file.empty()) {
            LOG(INFO) << "Loading configuration from: " << config_file;
            config = LoadBenchConfig(config_file);
        }
        if (!mode_override.empty()) {
            config.mode = ParseBenchConfig("{\"mode\": \"" + mode_override + "\"}").mode;
        }

        std::shared_ptr<const crypto::PrivateKey> key;
        if (config.key_file.empty()) {
            LOG(INFO) << "Generating signing key";
            key = std::make_shared<const crypto::PrivateKey>(crypto::PrivateKey::Generate());
        } else {
            LOG(INFO) << "Loading signing key from: " << config.key_file;
            key = std::make_shared<const crypto::PrivateKey>(crypto::PrivateKey::LoadFromFile(config.key_file));
        }

        std::string container = config.container;
        if (container.empty()) {
            container = ContainerID::FromBytes(crypto::RandomBytes(limits::CONTAINER_ID_SIZE)).ToString();
        }

        LoopbackOptions options;
        options.max_object_size = config.max_object_size;
        options.epoch = config.epoch;
        options.homomorphic_hashing_disabled = config.homomorphic_hashing_disabled;
        store = std::make_shared<LoopbackStore>(options);
        metrics = std::make_shared<MetricsRegistry>();

        TokenLifetime lifetime;
        lifetime.issued_at = config.epoch;
        lifetime.not_before = config.epoch;
        lifetime.expiration = config.epoch + 100;
        SessionToken base = SessionToken::CreateTemplate(
            *key, crypto::PublicKey::FromPrivateKey(*key).ToCompressed(), lifetime);

        client = std::make_unique<Client>(store, key, base, metrics);
        client->SetBufferSize(config.buffer_size);

        payload = crypto::RandomBytes(config.payload_size);

        LOG(INFO) << "Workload: mode=" << BenchModeName(config.mode) << " threads=" << config.threads
                  << " iterations=" << config.iterations << " payload=" << payload.size()
                  << " buffer=" << client->BufferSize() << " container=" << container;

        if (config.mode == BenchMode::Get) {
            for (int t = 0; t < config.threads; t++) {
                auto ctx = NewContext(config);
                PutResponse put = client->Put(*ctx, container, config.attributes, payload);
                if (!put.success) {
                    LOG(ERROR) << "Setup upload failed: " << put.error;
                    return 1;
                }
                object_ids.push_back(put.object_id);
            }
            LOG(INFO) << "Uploaded " << object_ids.size() << " objects for reading";
        } else if (config.mode == BenchMode::Prepared) {
            auto ctx = NewContext(config);
            prepared = std::make_unique<PreparedObject>(client->Prepare(*ctx, container, payload));
        }

        std::atomic<uint64_t> succeeded{0};
        std::atomic<uint64_t> failed{0};
        auto start = std::chrono::steady_clock::now();

        std::vector<std::thread> workers;
        for (int t = 0; t < config.threads; t++) {
            workers.emplace_back([&, t]() {
                for (int i = 0; i < config.iterations; i++) {
                    auto ctx = NewContext(config);
                    bool ok = false;
                    std::string error;

                    if (config.mode == BenchMode::Get) {
                        GetResponse get = client->Get(*ctx, container, object_ids[t]);
                        ok = get.success;
                        error = get.error;
                    } else {
                        auto attributes = config.attributes;
                        attributes["Iteration"] = std::to_string(t) + "-" + std::to_string(i);
                        PutResponse put = config.mode == BenchMode::Prepared
                            ? prepared->Put(*ctx, attributes)
                            : client->Put(*ctx, container, attributes, payload);
                        ok = put.success;
                        error = put.error;
                    }

                    if (ok) {
                        succeeded++;
                    } else {
                        failed++;
                        VLOG(1) << "Worker " << t << " iteration " << i << " failed: " << error;
                    }
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        uint64_t total = succeeded + failed;

        LOG(INFO) << "Completed " << total << " operations in " << seconds << " s ("
                  << (seconds > 0 ? static_cast<double>(total) / seconds : 0) << " ops/s), "
                  << failed << " failed";
        std::istringstream summary(metrics->Summary());
        for (std::string line; std::getline(summary, line);) {
            LOG(INFO) << "  " << line;
        }
        LOG(INFO) << "Objects in store: " << store->ObjectCount();
        return 0;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error: " << e.what();
        return 1;
    }
}
