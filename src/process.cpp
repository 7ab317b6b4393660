#include "process.h"
#include "constants.h"
#include <sys/wait.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace boxrun {

namespace {

void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

} // namespace

ProcessResult Process::run(const std::vector<std::string>& argv, bool merge_stderr) {
    if (argv.empty()) {
        throw std::runtime_error("Cannot spawn an empty command");
    }

    ProcessResult result;

    // Create pipes for stdout/stderr
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1 ||
        (!merge_stderr && pipe2(stderr_pipe, O_CLOEXEC) == -1)) {
        std::string reason = std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        throw std::runtime_error("Failed to create pipes: " + reason);
    }

    std::vector<char*> child_argv;
    for (const auto& arg : argv) {
        child_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    child_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        std::string reason = std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        throw std::runtime_error("Failed to fork process: " + reason);
    }

    if (pid == 0) {
        // Child process: redirect stdout/stderr to pipes
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(merge_stderr ? stdout_pipe[1] : stderr_pipe[1], STDERR_FILENO);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }

        execvp(child_argv[0], child_argv.data());
        perror("execvp");
        _exit(127);
    }

    // Parent process
    close(stdout_pipe[1]);
    stdout_pipe[1] = -1;
    if (!merge_stderr) {
        close(stderr_pipe[1]);
        stderr_pipe[1] = -1;
    }

    // Drain both pipes together so a full stderr pipe cannot block the child
    struct pollfd fds[2];
    std::string* sinks[2] = {&result.output, &result.error};
    nfds_t count = 0;
    fds[count++] = {stdout_pipe[0], POLLIN, 0};
    if (!merge_stderr) {
        fds[count++] = {stderr_pipe[0], POLLIN, 0};
    }

    char buffer[PIPE_BUFFER_SIZE];
    size_t open_fds = count;
    while (open_fds > 0) {
        int ready = poll(fds, count, -1);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t bytes_read = read(fds[i].fd, buffer, sizeof(buffer));
            if (bytes_read > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(bytes_read));
            } else if (bytes_read == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }

    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);

    // Wait for child to complete
    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (waited == -1) {
        throw std::runtime_error("Failed to wait for child process: " + std::string(std::strerror(errno)));
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -WTERMSIG(status);
    }

    return result;
}

} // namespace boxrun
