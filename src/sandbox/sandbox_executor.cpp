#include "sandbox/sandbox_executor.hpp"

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#else
#include <boost/process.hpp>
#endif
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <mutex>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"

namespace warden::sandbox {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

constexpr std::size_t kChunkBytes = 16 * 1024;
constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr auto kDrainTimeout = std::chrono::milliseconds(100);

void IgnoreBrokenPipes() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void MarkCloseOnExec(int fd) {
    const int flags = ::fcntl(fd, F_GETFD);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

void MarkNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Parent side of one of the child's output pipes.
struct Capture {
    int fd = -1;
    bool open = true;
    std::string* target = nullptr;
    std::size_t limit = 0;
    bool overflow = false;

    void Drain() {
        char buffer[kChunkBytes];
        while (open) {
            const auto count = ::read(fd, buffer, sizeof(buffer));
            if (count > 0) {
                const auto room = limit - std::min(limit, target->size());
                const auto keep = std::min(room, static_cast<std::size_t>(count));
                target->append(buffer, keep);
                overflow = overflow || keep < static_cast<std::size_t>(count);
                continue;
            }
            if (count < 0 && errno == EINTR) {
                continue;
            }
            if (count < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                return;
            }
            open = false;
        }
    }
};

class Pump {
public:
    Pump(bp::pipe& input_pipe, const std::string& input, Capture& out, Capture& err)
        : input_pipe_(input_pipe), input_(input), out_(out), err_(err) {
        if (input_.empty()) {
            CloseInput();
        }
    }

    bool OutputOpen() const { return out_.open || err_.open; }

    // Waits up to timeout for any pipe to become ready and services it.
    // Returns the number of ready pipes, or -1 when none is left to watch.
    int Step(std::chrono::milliseconds timeout) {
        pollfd fds[3];
        nfds_t count = 0;
        int input_slot = -1;
        if (input_pipe_.native_sink() >= 0) {
            input_slot = static_cast<int>(count);
            fds[count++] = pollfd{input_pipe_.native_sink(), POLLOUT, 0};
        }
        if (out_.open) {
            fds[count++] = pollfd{out_.fd, POLLIN, 0};
        }
        if (err_.open) {
            fds[count++] = pollfd{err_.fd, POLLIN, 0};
        }
        if (count == 0) {
            return -1;
        }
        const int ready = ::poll(fds, count, static_cast<int>(timeout.count()));
        if (ready <= 0) {
            return 0;
        }
        if (input_slot >= 0 && fds[input_slot].revents != 0) {
            Feed();
        }
        out_.Drain();
        err_.Drain();
        return ready;
    }

private:
    void Feed() {
        while (written_ < input_.size()) {
            const auto chunk = std::min(kChunkBytes, input_.size() - written_);
            const auto count = ::write(input_pipe_.native_sink(), input_.data() + written_, chunk);
            if (count > 0) {
                written_ += static_cast<std::size_t>(count);
                continue;
            }
            if (count < 0 && errno == EINTR) {
                continue;
            }
            if (count < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                return;
            }
            // EPIPE: the child stopped reading.
            break;
        }
        CloseInput();
    }

    void CloseInput() {
        if (input_pipe_.native_sink() >= 0) {
            ::close(input_pipe_.native_sink());
            input_pipe_.assign_sink(-1);
        }
    }

    bp::pipe& input_pipe_;
    const std::string& input_;
    std::size_t written_ = 0;
    Capture& out_;
    Capture& err_;
};

// Polls for exit while pumping pipes. Returns true once the child is reaped.
bool WaitUntil(pid_t pid, std::chrono::steady_clock::time_point deadline, Pump& pump, int& status,
               struct rusage& usage, bool& lost) {
    while (true) {
        const auto waited = ::wait4(pid, &status, WNOHANG, &usage);
        if (waited == pid) {
            return true;
        }
        if (waited < 0 && errno != EINTR) {
            lost = true;
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const auto slice = std::max(std::chrono::milliseconds(1), std::min(kPollInterval, remaining));
        if (pump.Step(slice) < 0) {
            ::poll(nullptr, 0, static_cast<int>(slice.count()));
        }
    }
}

}  // namespace

ExecResult SandboxExecutor::Run(const SpawnSpec& spec) {
    IgnoreBrokenPipes();
    ExecResult result{};
    const auto started = utils::SteadyNow();

    bp::pipe input_pipe;
    bp::pipe output_pipe;
    bp::pipe error_pipe;
    for (const auto& pipe : {&input_pipe, &output_pipe, &error_pipe}) {
        MarkCloseOnExec(pipe->native_source());
        MarkCloseOnExec(pipe->native_sink());
    }
    bp::environment env;

    pid_t pid = -1;
    try {
        bp::child child_process(
            bp::exe = spec.program,
            bp::args = spec.args,
            env,
            bp::std_in < input_pipe,
            bp::std_out > output_pipe,
            bp::std_err > error_pipe);
        pid = child_process.id();
        child_process.detach();
    } catch (const bp::process_error& ex) {
        result.spawn_error = std::string("exec failed: ") + ex.what();
        return result;
    }
    result.started = true;

    MarkNonBlocking(input_pipe.native_sink());
    MarkNonBlocking(output_pipe.native_source());
    MarkNonBlocking(error_pipe.native_source());
    Capture out{output_pipe.native_source(), true, &result.output, spec.max_capture_bytes};
    Capture err{error_pipe.native_source(), true, &result.error, spec.max_capture_bytes};
    Pump pump(input_pipe, spec.input, out, err);

    int status = 0;
    struct rusage usage {};
    bool lost = false;
    bool finished = WaitUntil(pid, started + spec.timeout, pump, status, usage, lost);
    bool sent_kill = false;
    if (!finished && !lost) {
        result.timed_out = true;
        ::kill(pid, SIGTERM);
        finished = WaitUntil(pid, utils::SteadyNow() + spec.kill_grace, pump, status, usage, lost);
        if (!finished && !lost) {
            ::kill(pid, SIGKILL);
            sent_kill = true;
            pid_t waited = -1;
            do {
                waited = ::wait4(pid, &status, 0, &usage);
            } while (waited < 0 && errno == EINTR);
            finished = waited == pid;
        }
    }

    while (pump.OutputOpen() && pump.Step(kDrainTimeout) > 0) {
    }

    if (finished) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.term_signal = WTERMSIG(status);
            result.exit_code = 128 + result.term_signal;
            result.killed_externally = result.term_signal == SIGKILL && !sent_kill;
        }
        result.peak_memory_mb = static_cast<double>(usage.ru_maxrss) / 1024.0;
    } else {
        result.spawn_error = "lost track of child process";
    }
    result.output_overflow = out.overflow || err.overflow;
    result.elapsed_ms = utils::ElapsedMs(started);
    return result;
}

}  // namespace warden::sandbox
