#include "executor.hpp"
#include "normalizer.hpp"
#include <iostream>

namespace codegate {

CodeExecutor::CodeExecutor(InterpreterLauncher& launcher, Confirmer confirm,
                           std::ostream& display, ExecutorOptions opts)
    : launcher_(launcher), confirm_(std::move(confirm)), display_(display), opts_(opts) {}

void CodeExecutor::show_source(const std::string& source) {
    display_ << "\n--- PROPOSED CLEANED CODE ---\n"
             << source << "\n"
             << "---------------------------\n\n" << std::flush;
}

ExecutionOutcome CodeExecutor::execute(const std::string& source) {
    if (source.empty()) {
        return ExecutionOutcome::empty();
    }

    show_source(source);

    if (!confirm_ || !confirm_(kConfirmPrompt)) {
        return ExecutionOutcome::cancelled();
    }

    LaunchResult launched;
    try {
        launched = launcher_.run(source, opts_.timeout);
    } catch (const std::exception& e) {
        std::cerr << "[exec] Launcher error: " << e.what() << "\n";
        return ExecutionOutcome::system_failure(e.what());
    }

    switch (launched.status) {
        case LaunchStatus::Exited:
            return ExecutionOutcome::completed(std::move(launched.stdout_text),
                                               std::move(launched.stderr_text),
                                               launched.exit_code);
        case LaunchStatus::TimedOut:
            std::cerr << "[exec] Killed interpreter after " << opts_.timeout.count() << "s\n";
            return ExecutionOutcome::timed_out();
        case LaunchStatus::Failed:
            std::cerr << "[exec] " << launched.error << "\n";
            return ExecutionOutcome::system_failure(launched.error);
    }
    return ExecutionOutcome::system_failure("unknown launch status");
}

std::string CodeExecutor::render(const ExecutionOutcome& outcome) const {
    RenderOptions ro;
    ro.timeout_seconds = static_cast<uint32_t>(opts_.timeout.count());
    ro.max_output_bytes = opts_.max_output_bytes;
    return render_outcome(outcome, ro);
}

std::string CodeExecutor::run(const std::string& raw_code) {
    try {
        return render(execute(normalize_code(raw_code)));
    } catch (const std::exception& e) {
        std::cerr << "[exec] " << e.what() << "\n";
        return render(ExecutionOutcome::system_failure(e.what()));
    }
}

} // namespace codegate
