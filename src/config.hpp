#pragma once

#include <cstdint>
#include <string>

struct SSourceConfig {
    uint64_t num_records = 20'000'000;
    uint32_t num_categories = 700;
    double weight_exponent = 1.3;
    int64_t start_time = 1717192800;  // 2024-05-31 22:00:00 UTC
    int64_t end_time = 1735599599;    // 2024-12-30 22:59:59 UTC
    int64_t min_price = 1;
    int64_t max_price = 100000;
    uint64_t batch_size = 1'000'000;
    uint64_t seed = 42;
    double retract_probability = 0.0;
};

struct SEngineConfig {
    uint32_t shards = 16;
    uint32_t workers = 1;
};

struct SOutputConfig {
    std::string filename = "aggregates.log";
    uint64_t max_file_mb = 10;
    uint64_t max_files = 10;
    bool console_report = false;
    bool log_diffs = false;
};

struct SAppConfig {
    SSourceConfig source;
    SEngineConfig engine;
    SOutputConfig output;
};

SAppConfig LoadConfig(int argc, char** argv);
bool ValidateConfig(const SAppConfig& cfg);
