#pragma once
#include "launcher.hpp"
#include <stdexcept>

namespace codegate {

class FakeLauncher : public InterpreterLauncher {
public:
    LaunchResult next_result;
    std::string last_source;
    std::chrono::milliseconds last_timeout{0};
    int call_count = 0;
    bool throw_on_run = false;

    LaunchResult run(const std::string& source, std::chrono::milliseconds timeout) override {
        call_count++;
        last_source = source;
        last_timeout = timeout;
        if (throw_on_run) throw std::runtime_error("launcher exploded");
        return next_result;
    }
};

inline LaunchResult exited(const std::string& out, const std::string& err, int code) {
    LaunchResult r;
    r.status = LaunchStatus::Exited;
    r.stdout_text = out;
    r.stderr_text = err;
    r.exit_code = code;
    return r;
}

} // namespace codegate
