#include "supervisor/command_runner.h"

#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace infergate {

namespace {

std::vector<char*> make_argv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

}  // namespace

CommandResult PosixCommandRunner::run(const std::vector<std::string>& args) {
    CommandResult result;
    if (args.empty()) {
        result.output = "empty command";
        return result;
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        result.output = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDERR_FILENO);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

    auto argv = make_argv(args);
    pid_t pid;
    int spawn_result = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    close(fds[1]);

    if (spawn_result != 0) {
        close(fds[0]);
        result.exit_code = 127;
        result.output = args[0] + ": " + std::strerror(spawn_result);
        return result;
    }

    char buf[4096];
    for (;;) {
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    close(fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.exit_code = -1;
            return result;
        }
    }
    result.exit_code = decode_wait_status(status);
    spdlog::debug("Command `{}` exited with {}", join_args(args), result.exit_code);
    return result;
}

bool PosixCommandRunner::spawnDetached(const std::vector<std::string>& args,
                                       const std::string& log_path,
                                       std::string& error) {
    if (args.empty()) {
        error = "empty command";
        return false;
    }

    // exec failures are reported back through a close-on-exec pipe
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        error = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }

    auto argv = make_argv(args);
    pid_t child = fork();
    if (child < 0) {
        error = std::string("fork failed: ") + std::strerror(errno);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return false;
    }

    if (child == 0) {
        close(err_pipe[0]);
        setsid();
        signal(SIGHUP, SIG_IGN);
        pid_t grandchild = fork();
        if (grandchild != 0) {
            _exit(grandchild < 0 ? 1 : 0);
        }

        int in = open("/dev/null", O_RDONLY);
        if (in >= 0) {
            dup2(in, STDIN_FILENO);
            close(in);
        }
        int out = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (out < 0) {
            int e = errno;
            ssize_t ignored = write(err_pipe[1], &e, sizeof(e));
            (void)ignored;
            _exit(127);
        }
        dup2(out, STDOUT_FILENO);
        dup2(out, STDERR_FILENO);
        close(out);

        execvp(argv[0], argv.data());
        int e = errno;
        ssize_t ignored = write(err_pipe[1], &e, sizeof(e));
        (void)ignored;
        _exit(127);
    }

    close(err_pipe[1]);
    int status = 0;
    while (waitpid(child, &status, 0) == -1 && errno == EINTR) {
    }

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        error = args[0] + ": " + std::strerror(child_errno);
        return false;
    }
    if (decode_wait_status(status) != 0) {
        error = "failed to detach " + args[0];
        return false;
    }
    spdlog::info("Spawned `{}` (log: {})", join_args(args), log_path);
    return true;
}

std::vector<std::string> splitCommandLine(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream iss(command);
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}

}  // namespace infergate
