#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>

namespace codegate {

enum class LaunchStatus { Exited, TimedOut, Failed };

struct LaunchResult {
    LaunchStatus status = LaunchStatus::Failed;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    std::string error; // set when status == Failed
};

// Runs a source text as a complete program in a fresh interpreter process.
// Implementations must enforce the deadline themselves and must not leave a
// running or unreaped child behind when they return.
class InterpreterLauncher {
public:
    virtual ~InterpreterLauncher() = default;
    virtual LaunchResult run(const std::string& source, std::chrono::milliseconds timeout) = 0;
};

class PosixInterpreterLauncher : public InterpreterLauncher {
public:
    explicit PosixInterpreterLauncher(std::string interpreter,
                                      std::vector<std::string> args = {"-c"});

    LaunchResult run(const std::string& source, std::chrono::milliseconds timeout) override;

    const std::string& interpreter() const { return interpreter_; }

    // Pid of the most recently spawned child (0 if none). The child has
    // always been reaped by the time run() returns.
    pid_t last_pid() const { return last_pid_; }

private:
    static constexpr auto kReapInterval = std::chrono::milliseconds(10);

    std::string interpreter_;
    std::vector<std::string> args_;
    pid_t last_pid_ = 0;
};

} // namespace codegate
