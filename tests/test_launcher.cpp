#include <catch2/catch_test_macros.hpp>
#include "launcher.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <filesystem>
#include <string>
#include <unistd.h>

using namespace codegate;
using namespace std::chrono_literals;

// True once the pid has been reaped and no longer exists
static bool process_gone(pid_t pid) {
    return kill(pid, 0) != 0 && errno == ESRCH;
}

static PosixInterpreterLauncher shell() {
    return PosixInterpreterLauncher("/bin/sh", {"-c"});
}

// ═══ Shell-backed ═════════════════════════════════════════════════

TEST_CASE("PosixInterpreterLauncher: captures stdout and exit 0", "[launcher]") {
    auto launcher = shell();
    auto r = launcher.run("echo hello", 10s);
    REQUIRE(r.status == LaunchStatus::Exited);
    REQUIRE(r.stdout_text == "hello\n");
    REQUIRE(r.stderr_text.empty());
    REQUIRE(r.exit_code == 0);
}

TEST_CASE("PosixInterpreterLauncher: stdout and stderr kept apart", "[launcher]") {
    auto launcher = shell();
    auto r = launcher.run("echo out; echo err >&2; exit 5", 10s);
    REQUIRE(r.status == LaunchStatus::Exited);
    REQUIRE(r.stdout_text == "out\n");
    REQUIRE(r.stderr_text == "err\n");
    REQUIRE(r.exit_code == 5);
}

TEST_CASE("PosixInterpreterLauncher: source passed as a single argument", "[launcher]") {
    auto launcher = shell();
    auto r = launcher.run("printf '%s|' \"a b\" 'c;d'", 10s);
    REQUIRE(r.status == LaunchStatus::Exited);
    REQUIRE(r.stdout_text == "a b|c;d|");
}

TEST_CASE("PosixInterpreterLauncher: stdin is not inherited", "[launcher]") {
    auto launcher = shell();
    auto start = std::chrono::steady_clock::now();
    auto r = launcher.run("cat; echo done", 10s);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(r.status == LaunchStatus::Exited);
    REQUIRE(r.stdout_text == "done\n");
    REQUIRE(elapsed < 5s);
}

TEST_CASE("PosixInterpreterLauncher: killed by signal reports -sig", "[launcher]") {
    auto launcher = shell();
    auto r = launcher.run("kill -9 $$", 10s);
    REQUIRE(r.status == LaunchStatus::Exited);
    REQUIRE(r.exit_code == -SIGKILL);
}

TEST_CASE("PosixInterpreterLauncher: parent descriptors are not inherited", "[launcher]") {
    if (!std::filesystem::exists("/proc/self/fd")) SKIP("no /proc/self/fd");

    // Plain open() without O_CLOEXEC, like a terminal stream held by main
    int held = open("/etc/passwd", O_RDONLY);
    REQUIRE(held > STDERR_FILENO);

    auto launcher = shell();
    std::string fd = std::to_string(held);
    auto r = launcher.run("if [ -e /proc/$$/fd/" + fd + " ]; then echo leaked; "
                          "else echo clean; fi; ls /proc/$$/fd", 10s);
    close(held);

    REQUIRE(r.status == LaunchStatus::Exited);
    REQUIRE(r.stdout_text.rfind("clean\n", 0) == 0);
    REQUIRE(r.stdout_text.find("leaked") == std::string::npos);
}

TEST_CASE("PosixInterpreterLauncher: stdin of the child is /dev/null", "[launcher]") {
    if (!std::filesystem::exists("/proc/self/fd")) SKIP("no /proc/self/fd");
    auto launcher = shell();
    auto r = launcher.run("readlink /proc/$$/fd/0", 10s);
    REQUIRE(r.status == LaunchStatus::Exited);
    REQUIRE(r.stdout_text == "/dev/null\n");
}

TEST_CASE("PosixInterpreterLauncher: embedded NUL is rejected without spawning", "[launcher]") {
    auto launcher = shell();
    std::string source("echo one\0echo two", 17);
    auto r = launcher.run(source, 10s);
    REQUIRE(r.status == LaunchStatus::Failed);
    REQUIRE(r.error == "source contains an embedded NUL byte");
    REQUIRE(r.stdout_text.empty());
    REQUIRE(launcher.last_pid() == 0);
}

TEST_CASE("PosixInterpreterLauncher: timeout kills and reaps the child", "[launcher]") {
    auto launcher = shell();
    auto start = std::chrono::steady_clock::now();
    auto r = launcher.run("echo early; sleep 30", 1s);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(r.status == LaunchStatus::TimedOut);
    REQUIRE(r.stdout_text.empty());
    REQUIRE(elapsed < 10s);
    REQUIRE(launcher.last_pid() > 0);
    REQUIRE(process_gone(launcher.last_pid()));
}

TEST_CASE("PosixInterpreterLauncher: timeout after closing output pipes", "[launcher]") {
    auto launcher = shell();
    auto start = std::chrono::steady_clock::now();
    auto r = launcher.run("exec >&- 2>&-; sleep 30", 1s);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(r.status == LaunchStatus::TimedOut);
    REQUIRE(elapsed < 10s);
    REQUIRE(process_gone(launcher.last_pid()));
}

TEST_CASE("PosixInterpreterLauncher: timeout also kills background children", "[launcher]") {
    auto launcher = shell();
    auto start = std::chrono::steady_clock::now();
    auto r = launcher.run("sleep 30 & sleep 30", 1s);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(r.status == LaunchStatus::TimedOut);
    REQUIRE(elapsed < 10s);
}

TEST_CASE("PosixInterpreterLauncher: missing interpreter is a launch failure", "[launcher]") {
    PosixInterpreterLauncher launcher("/nonexistent/codegate-python");
    auto r = launcher.run("print(1)", 10s);
    REQUIRE(r.status == LaunchStatus::Failed);
    REQUIRE(r.error.find("failed to launch '/nonexistent/codegate-python'") != std::string::npos);
    REQUIRE(process_gone(launcher.last_pid()));
}

TEST_CASE("PosixInterpreterLauncher: interpreter resolved through PATH", "[launcher]") {
    PosixInterpreterLauncher launcher("sh", {"-c"});
    auto r = launcher.run("echo via-path", 10s);
    REQUIRE(r.status == LaunchStatus::Exited);
    REQUIRE(r.stdout_text == "via-path\n");
}

// ═══ Python-backed ════════════════════════════════════════════════

TEST_CASE("PosixInterpreterLauncher: runs python -c", "[launcher][python]") {
    PosixInterpreterLauncher launcher("python3");
    auto r = launcher.run("print('hi')", 30s);
    REQUIRE(r.status == LaunchStatus::Exited);
    REQUIRE(r.stdout_text == "hi\n");
    REQUIRE(r.exit_code == 0);
}

TEST_CASE("PosixInterpreterLauncher: large output on both streams", "[launcher][python]") {
    PosixInterpreterLauncher launcher("python3");
    auto r = launcher.run(
        "import sys\nsys.stdout.write('a' * 200000)\nsys.stderr.write('b' * 200000)", 30s);
    REQUIRE(r.status == LaunchStatus::Exited);
    REQUIRE(r.stdout_text == std::string(200000, 'a'));
    REQUIRE(r.stderr_text == std::string(200000, 'b'));
}

TEST_CASE("PosixInterpreterLauncher: sequential runs are independent", "[launcher][python]") {
    PosixInterpreterLauncher launcher("python3");
    auto first = launcher.run("import os\nos.environ['X'] = '1'\nprint('first')", 30s);
    pid_t first_pid = launcher.last_pid();
    auto second = launcher.run("import os\nprint(os.environ.get('X', 'unset'))", 30s);
    REQUIRE(first.stdout_text == "first\n");
    REQUIRE(second.stdout_text == "unset\n");
    REQUIRE(launcher.last_pid() != first_pid);
}
