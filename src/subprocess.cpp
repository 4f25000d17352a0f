#include "subprocess.h"
#include "core/types.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace holo_oracle {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

} // namespace

std::string ProcessResult::describe() const {
    std::ostringstream oss;
    if (!error.empty()) {
        oss << error;
    } else if (timed_out) {
        oss << "timed out";
    } else if (term_signal != 0) {
        oss << "signal " << term_signal;
    } else {
        oss << "exit " << exit_code;
    }
    std::string err = stderr_data;
    while (!err.empty() && (err.back() == '\n' || err.back() == '\r')) err.pop_back();
    if (!err.empty()) {
        oss << " stderr=\"" << err << "\"";
    }
    return oss.str();
}

ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::string& stdin_data,
                          int timeout_ms) {
    ProcessResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(in_pipe, O_CLOEXEC) == -1 || pipe2(out_pipe, O_CLOEXEC) == -1 ||
        pipe2(err_pipe, O_CLOEXEC) == -1) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child: O_CLOEXEC closes the originals on exec
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvp(args[0], args.data());
        _exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    set_nonblocking(in_pipe[1]);
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    size_t written = 0;
    if (stdin_data.empty()) {
        close_fd(in_pipe[1]);
    }

    auto start = Clock::now();
    char buf[4096];

    while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
        int remaining = -1;
        if (timeout_ms > 0) {
            int64_t elapsed = ms_since(start);
            if (elapsed >= timeout_ms) {
                result.timed_out = true;
                break;
            }
            remaining = static_cast<int>(timeout_ms - elapsed);
        }

        struct pollfd fds[3];
        nfds_t n = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_pipe[0] >= 0) { fds[n] = {out_pipe[0], POLLIN, 0}; out_idx = static_cast<int>(n++); }
        if (err_pipe[0] >= 0) { fds[n] = {err_pipe[0], POLLIN, 0}; err_idx = static_cast<int>(n++); }
        if (in_pipe[1] >= 0) { fds[n] = {in_pipe[1], POLLOUT, 0}; in_idx = static_cast<int>(n++); }

        int ready = poll(fds, n, remaining);
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (ready == 0) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t w = write(in_pipe[1], stdin_data.data() + written, stdin_data.size() - written);
            if (w > 0) {
                written += static_cast<size_t>(w);
            }
            if (w < 0 && errno != EAGAIN && errno != EINTR) {
                close_fd(in_pipe[1]);  // child stopped reading
            } else if (written >= stdin_data.size()) {
                close_fd(in_pipe[1]);
            }
        }

        auto drain = [&buf](const struct pollfd* pfd, int& fd, std::string& sink) {
            if (!pfd || !(pfd->revents & (POLLIN | POLLHUP | POLLERR))) return;
            ssize_t r = read(fd, buf, sizeof(buf));
            if (r > 0) {
                sink.append(buf, static_cast<size_t>(r));
            } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
                close_fd(fd);
            }
        };
        drain(out_idx >= 0 ? &fds[out_idx] : nullptr, out_pipe[0], result.stdout_data);
        drain(err_idx >= 0 ? &fds[err_idx] : nullptr, err_pipe[0], result.stderr_data);
    }

    close_fd(in_pipe[1]);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    // Output closed; the child may still be exiting
    int status = 0;
    pid_t w = 0;
    while (!result.timed_out && result.error.empty()) {
        w = waitpid(pid, &status, WNOHANG);
        if (w == pid || (w == -1 && errno != EINTR)) break;
        if (timeout_ms > 0 && ms_since(start) >= timeout_ms) {
            result.timed_out = true;
            break;
        }
        usleep(2000);
    }

    if (w != pid) {
        kill(pid, SIGKILL);
        do {
            w = waitpid(pid, &status, 0);
        } while (w == -1 && errno == EINTR);
    }

    if (w == pid && !result.timed_out) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
            if (result.exit_code == 127 && result.error.empty()) {
                result.error = "could not execute " + argv[0];
            }
        } else if (WIFSIGNALED(status)) {
            result.term_signal = WTERMSIG(status);
        }
    }

    return result;
}

} // namespace holo_oracle
