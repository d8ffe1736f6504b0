#include "process_route_computer.hpp"
#include "worker_protocol.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <optional>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

void make_pipe(FileDescriptor& read_end, FileDescriptor& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw ComputationError(std::string("pipe2 failed: ") + std::strerror(errno));
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw ComputationError(std::string("fcntl failed: ") + std::strerror(errno));
    }
}

std::string describe_status(int status) {
    if (WIFEXITED(status)) {
        return "exited with code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "stopped with status " + std::to_string(status);
}

} // namespace

class ProcessRouteComputer::WorkerSlot {
public:
    explicit WorkerSlot(ProcessRouteComputer& owner) : owner_(owner) {
        std::unique_lock<std::mutex> lock(owner_.slots_mutex_);
        if (owner_.active_workers_ >= owner_.max_workers_) {
            spdlog::debug("All {} route workers busy, waiting for a free slot", owner_.max_workers_);
        }
        owner_.slots_cv_.wait(lock, [this] { return owner_.active_workers_ < owner_.max_workers_; });
        ++owner_.active_workers_;
    }

    ~WorkerSlot() {
        {
            std::lock_guard<std::mutex> lock(owner_.slots_mutex_);
            --owner_.active_workers_;
        }
        owner_.slots_cv_.notify_one();
    }

    WorkerSlot(const WorkerSlot&) = delete;
    WorkerSlot& operator=(const WorkerSlot&) = delete;

private:
    ProcessRouteComputer& owner_;
};

ProcessRouteComputer::ProcessRouteComputer(std::string worker_path, std::chrono::milliseconds timeout,
                                           int max_workers)
    : worker_path_(std::move(worker_path)), timeout_(timeout), max_workers_(max_workers) {
    // A worker that dies before reading its request must not take the server down with it
    std::signal(SIGPIPE, SIG_IGN);
}

int ProcessRouteComputer::active_workers() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return active_workers_;
}

std::vector<Route> ProcessRouteComputer::compute(const Token& input,
                                                 const Token& output,
                                                 const std::vector<Pool>& pools,
                                                 const RouteSearchLimits& limits) {
    RouteComputeRequest request{input, output, pools, limits};
    const auto payload = worker_protocol::encode_request(request);

    WorkerSlot slot(*this);

    FileDescriptor stdin_read, stdin_write, stdout_read, stdout_write;
    make_pipe(stdin_read, stdin_write);
    make_pipe(stdout_read, stdout_write);
    set_nonblocking(stdin_write.get());
    set_nonblocking(stdout_read.get());

    const auto start_time = std::chrono::steady_clock::now();
    const auto deadline = start_time + timeout_;

    pid_t pid = ::fork();
    if (pid < 0) {
        throw ComputationError(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls until exec
        if (::dup2(stdin_read.get(), STDIN_FILENO) < 0 || ::dup2(stdout_write.get(), STDOUT_FILENO) < 0) {
            ::_exit(126);
        }
        ::execl(worker_path_.c_str(), worker_path_.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    stdin_read.reset();
    stdout_write.reset();

    spdlog::debug("Spawned route worker pid {} for {} -> {} over {} pools",
                  pid, input.id, output.id, pools.size());

    auto kill_and_reap = [pid]() {
        ::kill(pid, SIGKILL);
        int ignored_status = 0;
        while (::waitpid(pid, &ignored_status, 0) < 0 && errno == EINTR) {
        }
    };

    codec::Bytes response_bytes;
    size_t written = 0;
    bool stdout_open = true;
    char buffer[64 * 1024];

    while (stdout_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            kill_and_reap();
            throw ComputationError("route worker timed out after " + std::to_string(timeout_.count()) + " ms");
        }

        pollfd fds[2];
        nfds_t count = 0;
        fds[count++] = {stdout_read.get(), POLLIN, 0};
        if (stdin_write.valid()) {
            fds[count++] = {stdin_write.get(), POLLOUT, 0};
        }

        int ready = ::poll(fds, count, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            kill_and_reap();
            throw ComputationError(std::string("poll failed: ") + std::strerror(errno));
        }

        if (count > 1 && fds[1].revents != 0) {
            if (fds[1].revents & (POLLERR | POLLHUP)) {
                // Worker closed its stdin early; its exit status tells the story
                stdin_write.reset();
            } else {
                ssize_t n = ::write(stdin_write.get(), payload.data() + written, payload.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written == payload.size()) {
                        stdin_write.reset();
                    }
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    stdin_write.reset();
                }
            }
        }

        if (fds[0].revents != 0) {
            ssize_t n = ::read(stdout_read.get(), buffer, sizeof(buffer));
            if (n > 0) {
                response_bytes.insert(response_bytes.end(), buffer, buffer + n);
            } else if (n == 0) {
                stdout_open = false;
            } else if (errno != EAGAIN && errno != EINTR) {
                kill_and_reap();
                throw ComputationError(std::string("reading worker output failed: ") + std::strerror(errno));
            }
        }
    }

    // stdout is closed; give the worker the rest of the deadline to exit
    int status = 0;
    while (true) {
        pid_t result = ::waitpid(pid, &status, WNOHANG);
        if (result == pid) break;
        if (result < 0 && errno != EINTR) {
            throw ComputationError(std::string("waitpid failed: ") + std::strerror(errno));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill_and_reap();
            throw ComputationError("route worker did not exit before the deadline");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    std::string reported_error;
    std::optional<RouteComputeResponse> response;
    if (!response_bytes.empty()) {
        try {
            response = worker_protocol::decode_response(response_bytes);
        } catch (const std::exception& e) {
            reported_error = std::string("malformed worker response: ") + e.what();
        }
    }
    if (response && !response->ok) {
        reported_error = response->error;
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw ComputationError("route worker " + describe_status(status) +
                               (reported_error.empty() ? "" : ": " + reported_error));
    }
    if (!response) {
        throw ComputationError(reported_error.empty() ? "route worker produced no response" : reported_error);
    }
    if (!response->ok) {
        throw ComputationError("route worker reported an error: " + reported_error);
    }

    spdlog::debug("Route worker pid {} returned {} routes in {} ms", pid, response->routes.size(), elapsed);
    return std::move(response->routes);
}
