#include "tool.hpp"
#include "config.hpp"
#include "launcher.hpp"
#include "tools/python_exec.hpp"

namespace codegate {

std::vector<std::unique_ptr<Tool>> create_builtin_tools(const Config& config,
                                                        Confirmer confirm,
                                                        std::ostream& display) {
    ExecutorOptions opts;
    opts.max_output_bytes = config.max_output_bytes;

    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<PythonExecTool>(
        std::make_unique<PosixInterpreterLauncher>(config.interpreter, config.interpreter_args),
        std::move(confirm), display, opts));
    return tools;
}

} // namespace codegate
