#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace codegate {

nlohmann::json Config::defaults_json() {
    return {
        {"interpreter", "python3"},
        {"interpreter_args", nlohmann::json::array({"-c"})},
        {"max_output_bytes", 10000}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static bool parse_uint32(const std::string& text, uint32_t& out) {
    if (text.empty() || text.size() > 10) return false;
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > std::numeric_limits<uint32_t>::max()) return false;
    out = static_cast<uint32_t>(value);
    return true;
}

void Config::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) return;

    if (j.contains("interpreter") && j["interpreter"].is_string()) {
        auto value = j["interpreter"].get<std::string>();
        if (!value.empty()) interpreter = value;
    }

    if (j.contains("interpreter_args") && j["interpreter_args"].is_array()) {
        std::vector<std::string> args;
        for (const auto& a : j["interpreter_args"]) {
            if (a.is_string()) args.push_back(a.get<std::string>());
        }
        // Without an option like -c the source would be taken as a script path
        if (!args.empty()) interpreter_args = std::move(args);
    }

    if (j.contains("max_output_bytes") && j["max_output_bytes"].is_number_unsigned())
        max_output_bytes = j["max_output_bytes"].get<uint32_t>();
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.codegate/config.json");
    nlohmann::json j = defaults_json();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), defaults_json());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    }

    cfg.apply_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("CODEGATE_INTERPRETER")) {
        if (*v != '\0') cfg.interpreter = v;
    }
    if (const char* v = std::getenv("CODEGATE_MAX_OUTPUT")) {
        uint32_t n = 0;
        if (parse_uint32(v, n)) {
            cfg.max_output_bytes = n;
        } else {
            std::cerr << "[config] Ignoring invalid CODEGATE_MAX_OUTPUT: " << v << "\n";
        }
    }

    return cfg;
}

} // namespace codegate
