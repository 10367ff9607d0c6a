#include "config.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

#include "logger.hpp"

namespace {
bool ParseBool(const std::string& val) {
    return val == "1" || val == "true" || val == "TRUE";
}

void ApplyJsonConfig(SAppConfig& cfg, const nlohmann::json& j) {
    // Source config
    if (j.contains("source") && j["source"].is_object()) {
        auto& src = j["source"];
        if (src.contains("num_records") && src["num_records"].is_number_unsigned()) cfg.source.num_records = src["num_records"];
        if (src.contains("num_categories") && src["num_categories"].is_number_unsigned()) cfg.source.num_categories = src["num_categories"];
        if (src.contains("weight_exponent") && src["weight_exponent"].is_number()) cfg.source.weight_exponent = src["weight_exponent"];
        if (src.contains("start_time") && src["start_time"].is_number_integer()) cfg.source.start_time = src["start_time"];
        if (src.contains("end_time") && src["end_time"].is_number_integer()) cfg.source.end_time = src["end_time"];
        if (src.contains("min_price") && src["min_price"].is_number_integer()) cfg.source.min_price = src["min_price"];
        if (src.contains("max_price") && src["max_price"].is_number_integer()) cfg.source.max_price = src["max_price"];
        if (src.contains("batch_size") && src["batch_size"].is_number_unsigned()) cfg.source.batch_size = src["batch_size"];
        if (src.contains("seed") && src["seed"].is_number_unsigned()) cfg.source.seed = src["seed"];
        if (src.contains("retract_probability") && src["retract_probability"].is_number()) cfg.source.retract_probability = src["retract_probability"];
    }

    // Engine config
    if (j.contains("engine") && j["engine"].is_object()) {
        auto& engine = j["engine"];
        if (engine.contains("shards") && engine["shards"].is_number_unsigned()) cfg.engine.shards = engine["shards"];
        if (engine.contains("workers") && engine["workers"].is_number_unsigned()) cfg.engine.workers = engine["workers"];
    }

    // Output config
    if (j.contains("output") && j["output"].is_object()) {
        auto& output = j["output"];
        if (output.contains("filename") && output["filename"].is_string()) cfg.output.filename = output["filename"];
        if (output.contains("max_file_mb") && output["max_file_mb"].is_number_unsigned()) cfg.output.max_file_mb = output["max_file_mb"];
        if (output.contains("max_files") && output["max_files"].is_number_unsigned()) cfg.output.max_files = output["max_files"];
        if (output.contains("console_report") && output["console_report"].is_boolean()) cfg.output.console_report = output["console_report"];
        if (output.contains("log_diffs") && output["log_diffs"].is_boolean()) cfg.output.log_diffs = output["log_diffs"];
    }
}

void ApplyCliOverrides(SAppConfig& cfg, int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const auto eq = arg.find('=');
        if (arg.rfind("--", 0) != 0 || eq == std::string::npos) {
            continue;
        }
        const std::string key = arg.substr(2, eq - 2);
        const std::string val = arg.substr(eq + 1);

        if (key == "config") {
            continue;
        } else if (key == "source-num-records") {
            cfg.source.num_records = std::stoull(val);
        } else if (key == "source-num-categories") {
            cfg.source.num_categories = static_cast<uint32_t>(std::stoul(val));
        } else if (key == "source-weight-exponent") {
            cfg.source.weight_exponent = std::stod(val);
        } else if (key == "source-start-time") {
            cfg.source.start_time = std::stoll(val);
        } else if (key == "source-end-time") {
            cfg.source.end_time = std::stoll(val);
        } else if (key == "source-min-price") {
            cfg.source.min_price = std::stoll(val);
        } else if (key == "source-max-price") {
            cfg.source.max_price = std::stoll(val);
        } else if (key == "source-batch-size") {
            cfg.source.batch_size = std::stoull(val);
        } else if (key == "source-seed") {
            cfg.source.seed = std::stoull(val);
        } else if (key == "source-retract-probability") {
            cfg.source.retract_probability = std::stod(val);
        } else if (key == "engine-shards") {
            cfg.engine.shards = static_cast<uint32_t>(std::stoul(val));
        } else if (key == "engine-workers") {
            cfg.engine.workers = static_cast<uint32_t>(std::stoul(val));
        } else if (key == "output-filename") {
            cfg.output.filename = val;
        } else if (key == "output-max-file-mb") {
            cfg.output.max_file_mb = std::stoull(val);
        } else if (key == "output-max-files") {
            cfg.output.max_files = std::stoull(val);
        } else if (key == "output-console-report") {
            cfg.output.console_report = ParseBool(val);
        } else if (key == "output-log-diffs") {
            cfg.output.log_diffs = ParseBool(val);
        }
    }
}
}

SAppConfig LoadConfig(int argc, char** argv) {
    std::string config_path = "config.json";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
            break;
        }
    }
    SAppConfig cfg;
    std::ifstream in(config_path);
    if (in) {
        try {
            nlohmann::json j;
            in >> j;
            ApplyJsonConfig(cfg, j);
        } catch (const std::exception& e) {
            Log(LogLevel::ERROR, "Config", "Failed to parse config file: " + std::string(e.what()));
        }
    }
    try {
        ApplyCliOverrides(cfg, argc, argv);
    } catch (const std::exception& e) {
        Log(LogLevel::ERROR, "Config", "Invalid CLI overrides: " + std::string(e.what()));
        throw;
    }
    return cfg;
}

bool ValidateConfig(const SAppConfig& cfg) {
    if (cfg.source.num_categories == 0) {
        Log(LogLevel::ERROR, "Config", "source.num_categories must be > 0.");
        return false;
    }
    if (cfg.source.weight_exponent < 0.0) {
        Log(LogLevel::ERROR, "Config", "source.weight_exponent must be >= 0.");
        return false;
    }
    if (cfg.source.start_time > cfg.source.end_time) {
        Log(LogLevel::ERROR, "Config", "source.start_time must be <= source.end_time.");
        return false;
    }
    if (cfg.source.min_price <= 0 || cfg.source.max_price <= cfg.source.min_price) {
        Log(LogLevel::ERROR, "Config", "source price range must satisfy 0 < min_price < max_price.");
        return false;
    }
    if (cfg.source.max_price > 92'233'720'368) {
        Log(LogLevel::ERROR, "Config", "source.max_price exceeds the fixed-point price range.");
        return false;
    }
    if (cfg.source.batch_size == 0) {
        Log(LogLevel::ERROR, "Config", "source.batch_size must be > 0.");
        return false;
    }
    if (cfg.source.retract_probability < 0.0 || cfg.source.retract_probability > 1.0) {
        Log(LogLevel::ERROR, "Config", "source.retract_probability must be within [0, 1].");
        return false;
    }
    if (cfg.engine.shards == 0) {
        Log(LogLevel::ERROR, "Config", "engine.shards must be > 0.");
        return false;
    }
    if (cfg.engine.workers == 0) {
        Log(LogLevel::ERROR, "Config", "engine.workers must be > 0.");
        return false;
    }
    if (cfg.output.filename.empty()) {
        Log(LogLevel::ERROR, "Config", "output.filename is empty.");
        return false;
    }
    if (cfg.output.max_file_mb == 0) {
        Log(LogLevel::ERROR, "Config", "output.max_file_mb must be > 0.");
        return false;
    }
    if (cfg.output.max_files == 0) {
        Log(LogLevel::ERROR, "Config", "output.max_files must be > 0.");
        return false;
    }
    {
        std::ofstream probe(cfg.output.filename, std::ios::app);
        if (!probe) {
            Log(LogLevel::ERROR, "Config", "output.filename is not writable: " + cfg.output.filename);
            return false;
        }
    }
    return true;
}
