#include "python_exec.hpp"
#include "tool_util.hpp"
#include "../normalizer.hpp"
#include <nlohmann/json.hpp>

namespace codegate {

PythonExecTool::PythonExecTool(std::unique_ptr<InterpreterLauncher> launcher,
                               Confirmer confirm, std::ostream& display,
                               ExecutorOptions opts)
    : launcher_(std::move(launcher)),
      executor_(*launcher_, std::move(confirm), display, opts) {}

ToolResult PythonExecTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "code")) return *err;

    std::string source = normalize_code(args["code"].get<std::string>());
    ExecutionOutcome outcome;
    try {
        outcome = executor_.execute(source);
    } catch (const std::exception& e) {
        outcome = ExecutionOutcome::system_failure(e.what());
    }
    return ToolResult{outcome.succeeded(), executor_.render(outcome)};
}

std::string PythonExecTool::description() const {
    return "Executes a given snippet of Python code and returns its standard output and "
           "standard error. Use this tool ONLY for running Python code. The input 'code' "
           "MUST be raw Python code only, without any surrounding text, explanations, or "
           "markdown fences (like ```python or ```). Ensure the Python code is self-contained "
           "and prints any results to standard output (e.g., using `print(result)`).";
}

std::string PythonExecTool::parameters_json() const {
    return R"json({"type":"object","properties":{"code":{"type":"string","description":"The Python code to execute. It should be a complete, runnable script without any markdown formatting."}},"required":["code"]})json";
}

} // namespace codegate
