#include "utils/exec.hpp"
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace cloudvm {
namespace utils {

namespace {

void close_pair(int fds[2]) {
    close(fds[0]);
    close(fds[1]);
}

// Drain both pipes until the child closes them. Reading one pipe to EOF
// before the other can block the child once the unread pipe fills up.
void drain_pipes(int out_fd, int err_fd, ExecResult& result) {
    std::array<char, 4096> buffer;
    struct pollfd fds[2] = {
        {out_fd, POLLIN, 0},
        {err_fd, POLLIN, 0},
    };
    int open_fds = 2;

    while (open_fds > 0) {
        int r = poll(fds, 2, -1);
        if (r < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                std::string& sink = (i == 0) ? result.stdout_output
                                             : result.stderr_output;
                sink.append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
            }
        }
    }
}

}  // anonymous namespace

ExecResult exec(const std::string& command,
                const std::vector<std::string>& args) {
    ExecResult result;

    std::vector<char*> c_args;
    c_args.push_back(const_cast<char*>(command.c_str()));
    for (const auto& arg : args) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) < 0) {
        result.stderr_output = "Failed to create pipes: " + std::string(strerror(errno));
        return result;
    }
    if (pipe(stderr_pipe) < 0) {
        result.stderr_output = "Failed to create pipes: " + std::string(strerror(errno));
        close_pair(stdout_pipe);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.stderr_output = "Fork failed: " + std::string(strerror(errno));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        execvp(command.c_str(), c_args.data());
        _exit(127);  // exec failed
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    drain_pipes(stdout_pipe[0], stderr_pipe[0], result);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.stderr_output += "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (result.exit_code == 127 && result.stderr_output.empty()) {
        result.stderr_output = command + ": command not found";
    }

    return result;
}

std::string format_command(const std::string& command,
                           const std::vector<std::string>& args) {
    std::ostringstream ss;
    ss << command;
    for (const auto& arg : args) {
        if (arg.empty() || arg.find_first_of(" \t'\"") != std::string::npos) {
            ss << " '" << arg << "'";
        } else {
            ss << " " << arg;
        }
    }
    return ss.str();
}

} // namespace utils
} // namespace cloudvm
