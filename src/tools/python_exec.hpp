#pragma once
#include "../tool.hpp"
#include "../executor.hpp"
#include "../launcher.hpp"
#include <memory>

namespace codegate {

class PythonExecTool : public Tool {
public:
    PythonExecTool(std::unique_ptr<InterpreterLauncher> launcher, Confirmer confirm,
                   std::ostream& display, ExecutorOptions opts = {});

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "python_code_executor"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    std::unique_ptr<InterpreterLauncher> launcher_;
    CodeExecutor executor_;
};

} // namespace codegate
