#include "launcher.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <initializer_list>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace codegate {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

LaunchResult failed(const std::string& what) {
    LaunchResult r;
    r.status = LaunchStatus::Failed;
    r.error = what;
    return r;
}

std::string errno_message(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

// Signal deaths are reported as -signo
int decode_exit_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

// Descriptors above stderr that a child would inherit. Listed in the parent
// because directory iteration is not async-signal-safe.
std::vector<int> inheritable_descriptors() {
    std::vector<int> fds;
    std::error_code ec;
    for (const char* dir : {"/proc/self/fd", "/dev/fd"}) {
        std::filesystem::directory_iterator it(dir, ec);
        if (ec) continue;
        for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            try {
                int fd = std::stoi(it->path().filename().string());
                if (fd > STDERR_FILENO) fds.push_back(fd);
            } catch (const std::exception&) {
                continue;
            }
        }
        if (!ec) return fds;
        fds.clear();
    }

    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) max_fd = 65536;
    for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) fds.push_back(fd);
    return fds;
}

// Kill the child's whole session and reap it
void kill_and_reap(pid_t pid) {
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace

PosixInterpreterLauncher::PosixInterpreterLauncher(std::string interpreter,
                                                   std::vector<std::string> args)
    : interpreter_(std::move(interpreter)), args_(std::move(args)) {}

LaunchResult PosixInterpreterLauncher::run(const std::string& source,
                                           std::chrono::milliseconds timeout) {
    // execvp would silently cut the program at the first NUL
    if (source.find('\0') != std::string::npos) {
        return failed("source contains an embedded NUL byte");
    }

    // argv is built before fork so the child only makes async-signal-safe calls
    std::vector<std::string> args;
    args.push_back(interpreter_);
    args.insert(args.end(), args_.begin(), args_.end());
    args.push_back(source);
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe(exec_pipe) != 0) {
        int err = errno;
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return failed(errno_message("Failed to create pipes", err));
    }
    // Closed by a successful exec, so EOF on the read end means the
    // interpreter is running
    fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);
    const std::vector<int> inherited = inheritable_descriptors();

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return failed(errno_message("Failed to fork process", err));
    }

    if (pid == 0) {
        // Child process: own session, no terminal input
        setsid();
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        close(exec_pipe[0]);
        // Nothing else the parent holds (the operator's terminal included)
        // reaches the interpreter
        for (int fd : inherited) {
            if (fd != exec_pipe[1]) close(fd);
        }
        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    last_pid_ = pid;
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        kill_and_reap(pid);
        return failed(errno_message("failed to launch '" + interpreter_ + "'", exec_errno));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string output[2];
    struct pollfd fds[2];
    fds[0] = {out_pipe[0], POLLIN, 0};
    fds[1] = {err_pipe[0], POLLIN, 0};
    std::array<char, 4096> buffer;
    bool timed_out = false;

    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        int ret = poll(fds, 2, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close_fd(out_pipe[0]);
            close_fd(err_pipe[0]);
            kill_and_reap(pid);
            return failed(errno_message("Failed to poll child output", err));
        }
        if (ret == 0) continue; // deadline re-checked at the top

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t got = read(fds[i].fd, buffer.data(), buffer.size());
            if (got > 0) {
                output[i].append(buffer.data(), static_cast<size_t>(got));
            } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
                // EOF or a dead pipe; poll skips negative fds
                fds[i].fd = -1;
            }
        }
    }

    // Pipes can close before the process exits, so reaping is also bounded
    int status = 0;
    while (!timed_out) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) {
            int err = errno;
            close_fd(out_pipe[0]);
            close_fd(err_pipe[0]);
            kill_and_reap(pid);
            return failed(errno_message("Failed to wait for child", err));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            break;
        }
        std::this_thread::sleep_for(kReapInterval);
    }

    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    LaunchResult result;
    if (timed_out) {
        kill_and_reap(pid);
        result.status = LaunchStatus::TimedOut;
        return result;
    }

    result.status = LaunchStatus::Exited;
    result.stdout_text = std::move(output[0]);
    result.stderr_text = std::move(output[1]);
    result.exit_code = decode_exit_status(status);
    return result;
}

} // namespace codegate
