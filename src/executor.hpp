#pragma once
#include "confirm.hpp"
#include "launcher.hpp"
#include "outcome.hpp"
#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

namespace codegate {

struct ExecutorOptions {
    std::chrono::seconds timeout{60};
    uint32_t max_output_bytes = 10000;
};

// Confirmation-gated execution of normalized source. Not reentrant: callers
// must not start a second execute() while one is in flight.
class CodeExecutor {
public:
    CodeExecutor(InterpreterLauncher& launcher, Confirmer confirm,
                 std::ostream& display, ExecutorOptions opts = {});

    // Empty source returns Empty without prompting. Otherwise the source is
    // shown on the display stream and nothing is launched unless the
    // confirmer approves.
    ExecutionOutcome execute(const std::string& source);

    std::string render(const ExecutionOutcome& outcome) const;

    // normalize -> execute -> render; never throws past this call
    std::string run(const std::string& raw_code);

    const ExecutorOptions& options() const { return opts_; }

private:
    void show_source(const std::string& source);

    InterpreterLauncher& launcher_;
    Confirmer confirm_;
    std::ostream& display_;
    ExecutorOptions opts_;
};

} // namespace codegate
