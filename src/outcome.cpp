#include "outcome.hpp"
#include "util.hpp"

namespace codegate {

const char* const kCancelledMessage = "Code execution CANCELED by user.";
const char* const kEmptyMessage =
    "Error: No valid Python code provided after cleaning. "
    "The input might have been empty or only markdown.";
const char* const kNoOutputMessage =
    "Code executed successfully with no output to stdout or stderr.";

ExecutionOutcome ExecutionOutcome::cancelled() {
    ExecutionOutcome o;
    o.kind = OutcomeKind::Cancelled;
    return o;
}

ExecutionOutcome ExecutionOutcome::empty() {
    ExecutionOutcome o;
    o.kind = OutcomeKind::Empty;
    return o;
}

ExecutionOutcome ExecutionOutcome::completed(std::string out, std::string err, int exit_code) {
    ExecutionOutcome o;
    o.kind = OutcomeKind::Completed;
    o.stdout_text = std::move(out);
    o.stderr_text = std::move(err);
    o.exit_code = exit_code;
    return o;
}

ExecutionOutcome ExecutionOutcome::timed_out() {
    ExecutionOutcome o;
    o.kind = OutcomeKind::TimedOut;
    return o;
}

ExecutionOutcome ExecutionOutcome::system_failure(std::string message) {
    ExecutionOutcome o;
    o.kind = OutcomeKind::SystemFailure;
    o.message = std::move(message);
    return o;
}

static std::string cap_stream(const std::string& text, uint32_t max_bytes) {
    if (max_bytes == 0 || text.size() <= max_bytes) return trim(text);
    // Cut before a UTF-8 continuation byte never splits a code point
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return trim(text.substr(0, cut)) + "\n[truncated]";
}

static std::string render_completed(const ExecutionOutcome& o, const RenderOptions& opts) {
    std::string result;
    if (!o.stdout_text.empty()) {
        result += "Standard Output:\n" + cap_stream(o.stdout_text, opts.max_output_bytes);
    }
    if (!o.stderr_text.empty()) {
        if (!result.empty()) result += "\n";
        result += "Standard Error:\n" + cap_stream(o.stderr_text, opts.max_output_bytes);
    }

    if (result.empty()) {
        if (o.exit_code == 0) return kNoOutputMessage;
        return "Code execution failed with return code " + std::to_string(o.exit_code) +
               " and no specific error message.";
    }

    // Without stderr a failing exit status would otherwise look like success
    if (o.exit_code != 0 && o.stderr_text.empty()) {
        result += "\nCode execution finished with return code: " + std::to_string(o.exit_code);
    }
    return trim(result);
}

std::string render_outcome(const ExecutionOutcome& outcome, const RenderOptions& opts) {
    switch (outcome.kind) {
        case OutcomeKind::Cancelled:
            return kCancelledMessage;
        case OutcomeKind::Empty:
            return kEmptyMessage;
        case OutcomeKind::Completed:
            return render_completed(outcome, opts);
        case OutcomeKind::TimedOut:
            return "Error: Code execution timed out after " +
                   std::to_string(opts.timeout_seconds) + " seconds.";
        case OutcomeKind::SystemFailure:
            return "An unexpected error occurred during Python code execution: " +
                   outcome.message;
    }
    return kEmptyMessage;
}

} // namespace codegate
