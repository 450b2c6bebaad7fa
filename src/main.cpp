#include "config.hpp"
#include "confirm.hpp"
#include "tool.hpp"
#include "util.hpp"
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <string>

static void print_usage() {
    std::cout << "Usage: codegate [options] [CODE]\n"
              << "\n"
              << "Shows the code, asks for confirmation, then runs it in a fresh Python\n"
              << "process with a 60 second deadline and prints the result.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --code CODE      Code to run (markdown fences are stripped)\n"
              << "  -f, --file PATH      Read the code from a file\n"
              << "  --args JSON          Call the tool with raw JSON arguments ({\"code\": ...})\n"
              << "  --spec               Print the tool spec as JSON and exit\n"
              << "  --python PATH        Interpreter to launch (default: python3)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "With no code given, the code is read from stdin and the confirmation\n"
              << "is read from the terminal.\n"
              << "\n"
              << "Environment variables:\n"
              << "  CODEGATE_INTERPRETER Interpreter to launch\n"
              << "  CODEGATE_MAX_OUTPUT  Per-stream output cap in bytes\n";
}

int main(int argc, char* argv[]) try {
    std::string code;
    std::string args_json;
    std::string file_path;
    std::string interpreter;
    bool have_code = false;
    bool print_spec = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--code") == 0) && i + 1 < argc) {
            code = argv[++i];
            have_code = true;
        } else if ((std::strcmp(argv[i], "-f") == 0 || std::strcmp(argv[i], "--file") == 0) && i + 1 < argc) {
            file_path = argv[++i];
        } else if (std::strcmp(argv[i], "--args") == 0 && i + 1 < argc) {
            args_json = argv[++i];
        } else if (std::strcmp(argv[i], "--spec") == 0) {
            print_spec = true;
        } else if (std::strcmp(argv[i], "--python") == 0 && i + 1 < argc) {
            interpreter = argv[++i];
        } else if (argv[i][0] != '-' && !have_code) {
            code = argv[i];
            have_code = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 2;
        }
    }

    auto config = codegate::Config::load();
    if (!interpreter.empty()) {
        config.interpreter = interpreter;
    }

    bool code_from_stdin = false;
    if (args_json.empty() && !have_code && !print_spec) {
        if (!file_path.empty()) {
            if (!codegate::read_file(file_path, code)) {
                std::cerr << "Error: cannot read " << file_path << "\n";
                return 2;
            }
        } else {
            code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
            code_from_stdin = true;
        }
    }

    // stdin is consumed by the code itself, so ask on the terminal instead
    std::ifstream tty;
    std::istream* answer_in = &std::cin;
    if (code_from_stdin) {
        tty.open("/dev/tty");
        answer_in = &tty;
    }
    codegate::StreamConfirmer confirmer(*answer_in, std::cerr);

    auto tools = codegate::create_builtin_tools(config, confirmer, std::cerr);
    auto& tool = *tools.front();

    if (print_spec) {
        auto spec = tool.spec();
        nlohmann::json out = {
            {"name", spec.name},
            {"description", spec.description},
            {"parameters", nlohmann::json::parse(spec.parameters_json)}
        };
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (args_json.empty()) {
        args_json = nlohmann::json{{"code", code}}.dump();
    }

    auto result = tool.execute(args_json);
    std::cout << result.output << "\n";
    return result.success ? 0 : 1;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
