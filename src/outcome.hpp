#pragma once
#include <string>
#include <cstdint>

namespace codegate {

enum class OutcomeKind { Cancelled, Empty, Completed, TimedOut, SystemFailure };

// Result of one execution request. Only the fields belonging to `kind` are
// meaningful: stdout/stderr/exit_code for Completed, message for
// SystemFailure.
struct ExecutionOutcome {
    OutcomeKind kind = OutcomeKind::Empty;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    std::string message;

    static ExecutionOutcome cancelled();
    static ExecutionOutcome empty();
    static ExecutionOutcome completed(std::string out, std::string err, int exit_code);
    static ExecutionOutcome timed_out();
    static ExecutionOutcome system_failure(std::string message);

    // The executed program ran to completion and exited 0
    bool succeeded() const { return kind == OutcomeKind::Completed && exit_code == 0; }
};

// Sentences the orchestrator matches on
extern const char* const kCancelledMessage;
extern const char* const kEmptyMessage;
extern const char* const kNoOutputMessage;

struct RenderOptions {
    uint32_t timeout_seconds = 60;
    uint32_t max_output_bytes = 10000; // per stream, 0 = unlimited
};

// Produce the single text blob returned to the orchestrator
std::string render_outcome(const ExecutionOutcome& outcome, const RenderOptions& opts = {});

} // namespace codegate
