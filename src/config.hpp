#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

namespace codegate {

struct Config {
    // Interpreter executable, resolved through PATH when it has no slash
    std::string interpreter = "python3";
    // Arguments placed before the source text ("-c" passes it as a program)
    std::vector<std::string> interpreter_args = {"-c"};
    // Per-stream cap applied to captured output before rendering
    uint32_t max_output_bytes = 10000;

    // Load from ~/.codegate/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply a parsed config document on top of the current values
    void apply_json(const nlohmann::json& j);
};

} // namespace codegate
