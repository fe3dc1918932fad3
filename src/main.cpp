/**
 * @file main.cpp
 * @brief TierGuard demo driver
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "policy_engine.hpp"
#include <iostream>
#include <string>
#include <filesystem>

using namespace tierguard;

void printBanner() {
    std::cout << R"(
+===============================================================+
|        TierGuard - Storage Backend Policy & Tiered Cache      |
|                         Version 1.0.0                         |
|                    Author: Bennie Shearer                     |
|         Copyright (c) 2025 Bennie Shearer - MIT License        |
+===============================================================+
)" << "\n";
}

static Bytes payload(size_t n, uint8_t fill) { return Bytes(n, fill); }

static void report(const std::string& what, const Result<ObjectRecord>& r) {
    if (r) std::cout << "  " << what << ": stored " << formatBytes(r->size_bytes) << " on " << r->backend_id << "\n";
    else std::cout << "  " << what << ": " << r.error().toString() << "\n";
}

int main(int argc, char* argv[]) {
    printBanner();

    EngineConfig config;
    if (argc > 1) {
        auto loaded = EngineConfigLoader::loadFromFile(argv[1]);
        if (!loaded) {
            std::cerr << "Failed to load configuration: " << loaded.error().toString() << "\n";
            return 1;
        }
        config = loaded.value();
    }
    std::cout << config.toString() << "\n";

    PolicyEngine engine;
    if (auto r = engine.initialize(config); !r) {
        std::cerr << "Failed to initialize engine: " << r.error().toString() << "\n";
        return 1;
    }

    // Three in-memory backends: a hot cache, a warm object store, a cold archive
    struct Demo { BackendId id; CostTier tier; std::string region; };
    for (const auto& d : {Demo{"local", CostTier::HOT, "us-east"}, Demo{"objstore", CostTier::WARM, "us-west"},
                          Demo{"archive", CostTier::COLD, "eu-central"}}) {
        BackendInfo info{d.id, BackendCapabilities{true, d.tier != CostTier::COLD, d.tier}, d.region, true};
        if (auto r = engine.registerBackend(info, std::make_shared<MemoryBackendAdapter>(d.id)); !r) {
            std::cerr << "Failed to register " << d.id << ": " << r.error().toString() << "\n";
            return 1;
        }
    }

    std::vector<std::pair<BackendId, Policy>> policies = {
        {"local", StorageQuotaPolicy{1000, 0, 0.8}},
        {"local", CachePolicy{4096, 1, Seconds(0)}},
        {"objstore", CachePolicy{65536, 3, Seconds(600)}},
        {"local", ReplicationPolicy{ReplicationStrategy::GEO_AWARE, 1, 1, {"objstore", "archive"}}},
        {"local", RetentionPolicy{Seconds(0), Seconds(86400 * 30), false}},
    };
    for (const auto& [backend, policy] : policies) {
        if (auto r = engine.setPolicy(backend, policy); !r) {
            std::cerr << "Rejected policy on " << backend << ": " << r.error().toString() << "\n";
            return 1;
        }
    }

    if (auto r = engine.configureCacheTiers({"local", "objstore"}); !r) {
        std::cerr << "Failed to configure cache: " << r.error().toString() << "\n";
        return 1;
    }
    if (auto r = engine.start(); !r) {
        std::cerr << "Failed to start engine: " << r.error().toString() << "\n";
        return 1;
    }

    std::cout << "Storing objects on 'local' (quota 1000 bytes, warn at 80%):\n";
    report("obj-1", engine.storeObject("local", "obj-1", payload(600, 1)));
    report("obj-2", engine.storeObject("local", "obj-2", payload(250, 2)));
    report("obj-3", engine.storeObject("local", "obj-3", payload(200, 3)));

    for (int i = 0; i < 3; ++i) {
        auto data = engine.readObject("obj-1");
        if (!data) std::cout << "  read obj-1: " << data.error().toString() << "\n";
    }
    engine.runMaintenance();

    std::cout << "\n" << engine.statusReport() << "\n";

    engine.stop();
    Logger::instance().shutdown();
    return 0;
}
