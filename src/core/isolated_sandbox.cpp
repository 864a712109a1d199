/**
 * @file isolated_sandbox.cpp
 * @brief Worker-process execution with a kill-on-timeout watchdog
 *
 * **Worker layout**:
 * - fd 0: /dev/null
 * - fd 1, 2: diagnostics pipe (surfaced as `stack` on abnormal exit)
 * - fd 3: bridge socket
 * - rlimits from security::LimitsFor(), PR_SET_PDEATHSIG = SIGKILL
 *
 * **Host loop**: poll() the bridge and the diagnostics pipe until a result
 * arrives, the bridge closes, or the hard deadline passes. Capability calls
 * are served inline and never awaited past the script deadline.
 *
 * @date 2025
 */

#include "capsule/core/isolated_sandbox.hpp"
#include "capsule/bindings/bridge_protocol.hpp"
#include "capsule/core/script_prelude.hpp"
#include "capsule/monitors/metrics_collector.hpp"
#include "capsule/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace capsule {
namespace core {

namespace {

constexpr int kWorkerChannelFd = 3;
constexpr std::size_t kMaxDiagnosticsBytes = 64 * 1024;
constexpr auto kPollSlice = std::chrono::milliseconds(100);
constexpr auto kReapGrace = std::chrono::milliseconds(500);

/// dup2() that also clears FD_CLOEXEC when source and target coincide
void MoveDescriptor(int from, int to) noexcept {
    if (from == to) {
        fcntl(to, F_SETFD, 0);
    } else {
        dup2(from, to);
    }
}

/// Duplicate @p fd to a number above the worker's fixed descriptors
int LiftDescriptor(int fd) noexcept {
    return fcntl(fd, F_DUPFD, kWorkerChannelFd + 1);
}

std::vector<char*> ToArgv(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

void AppendDiagnostics(int fd, std::string& diagnostics, bool& open) {
    std::string chunk;
    auto status = utils::ReadAvailable(fd, chunk);
    if (diagnostics.size() < kMaxDiagnosticsBytes) {
        diagnostics.append(chunk, 0, kMaxDiagnosticsBytes - diagnostics.size());
    }
    if (status == utils::ReadStatus::CLOSED || status == utils::ReadStatus::FAILED) {
        open = false;
    }
}

std::string Errno(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // anonymous namespace

IsolatedSandbox::IsolatedSandbox(SandboxOptions options, RuntimeSettings settings)
    : options_(options)
    , settings_(std::move(settings)) {
    spdlog::debug("Isolated sandbox created (timeout: {}ms, memory: {}MB)",
                  options_.timeout.count(), options_.memory_limit_mb);
}

SandboxResult IsolatedSandbox::Execute(const std::string& code,
                                       const bindings::CapabilityMap& bindings) {
    if (disposed_.load()) {
        return MakeFailure(kDisposedMessage);
    }
    return RunWorker(code, bindings);
}

SandboxResult IsolatedSandbox::RunWorker(const std::string& code,
                                         const bindings::CapabilityMap& bindings) {
    auto python = utils::ResolveExecutable(settings_.python_executable);
    if (!python) {
        return MakeFailure("Python interpreter not found: " + settings_.python_executable);
    }

    bindings::CapabilityDispatcher dispatcher(bindings);
    const auto limits = security::LimitsFor(options_);

    // Everything the child touches is prepared before fork()
    std::vector<std::string> arg_strings = {python->string(), "-I", "-S", "-c", WorkerBootstrap()};
    std::vector<std::string> env_strings = {"LANG=C.UTF-8"};
    auto argv = ToArgv(arg_strings);
    auto envp = ToArgv(env_strings);

    int channel[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, channel) != 0) {
        return MakeFailure(Errno("Failed to create worker channel"));
    }
    utils::FileDescriptor host_end(channel[0]);
    utils::FileDescriptor worker_end(channel[1]);

    int diag[2];
    if (pipe2(diag, O_CLOEXEC) != 0) {
        return MakeFailure(Errno("Failed to create diagnostics pipe"));
    }
    utils::FileDescriptor diag_read(diag[0]);
    utils::FileDescriptor diag_write(diag[1]);

    utils::FileDescriptor null_input(open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!null_input.IsValid()) {
        return MakeFailure(Errno("Failed to open /dev/null"));
    }

    monitors::MetricsCollector metrics;
    metrics.Start();
    const auto script_deadline = std::chrono::steady_clock::now() + options_.timeout;
    const auto kill_deadline = script_deadline + kHardKillBuffer;

    pid_t pid = fork();
    if (pid < 0) {
        return MakeFailure(Errno("Failed to fork worker"));
    }

    if (pid == 0) {
        // Async-signal-safe calls only from here to execve()
        prctl(PR_SET_PDEATHSIG, SIGKILL);
        // Sources may sit on 0-3 when the host runs with standard streams closed
        const int input_fd = LiftDescriptor(null_input.Get());
        const int output_fd = LiftDescriptor(diag_write.Get());
        const int channel_fd = LiftDescriptor(worker_end.Get());
        if (input_fd < 0 || output_fd < 0 || channel_fd < 0) {
            _exit(127);
        }
        MoveDescriptor(input_fd, STDIN_FILENO);
        MoveDescriptor(output_fd, STDOUT_FILENO);
        MoveDescriptor(output_fd, STDERR_FILENO);
        MoveDescriptor(channel_fd, kWorkerChannelFd);
        utils::CloseDescriptorsFrom(kWorkerChannelFd + 1);
        utils::ApplyResourceLimits(limits);
        execve(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    worker_end.Reset();
    diag_write.Reset();
    null_input.Reset();
    utils::SetNonBlocking(host_end.Get());
    utils::SetNonBlocking(diag_read.Get());

    spdlog::debug("Spawned worker {} ({})", pid, arg_strings[0]);

    const auto start = bindings::MakeStartMessage(code, dispatcher.Shape(), options_.timeout,
                                                  nlohmann::json(settings_.policy));
    if (!utils::SendAll(host_end.Get(), bindings::EncodeLine(start), kill_deadline)) {
        spdlog::debug("Worker {} did not accept the start message", pid);
    }

    std::optional<bindings::WorkerResult> report;
    std::string protocol_error;
    std::string channel_buffer;
    std::string diagnostics;
    bool diag_open = true;
    bool timed_out = false;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= kill_deadline) {
            timed_out = true;
            break;
        }

        auto slice = std::min<std::chrono::milliseconds>(
            kPollSlice, std::chrono::duration_cast<std::chrono::milliseconds>(kill_deadline - now) +
                            std::chrono::milliseconds(1));

        struct pollfd fds[2] = {
            {host_end.Get(), POLLIN, 0},
            {diag_open ? diag_read.Get() : -1, POLLIN, 0}
        };
        int ready = poll(fds, 2, static_cast<int>(slice.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            protocol_error = Errno("poll failed");
            break;
        }
        if (ready == 0) {
            continue;
        }

        if (diag_open && fds[1].revents != 0) {
            AppendDiagnostics(diag_read.Get(), diagnostics, diag_open);
        }

        if (fds[0].revents == 0) {
            continue;
        }

        auto status = utils::ReadAvailable(host_end.Get(), channel_buffer);
        while (auto line = utils::TakeLine(channel_buffer)) {
            nlohmann::json message;
            try {
                message = nlohmann::json::parse(*line);
            } catch (const nlohmann::json::parse_error& e) {
                protocol_error = std::string("malformed message: ") + e.what();
                break;
            }

            auto type = bindings::GetMessageType(message);
            if (type == bindings::MessageType::CALL) {
                auto request = bindings::ParseCallRequest(message);
                if (!request) {
                    protocol_error = "malformed call message";
                    break;
                }
                auto reply = bindings::ServeCall(dispatcher, *request, script_deadline);
                if (!utils::SendAll(host_end.Get(), bindings::EncodeLine(reply), kill_deadline)) {
                    spdlog::debug("Worker {} went away before reply {}", pid, request->request_id);
                }
            } else if (type == bindings::MessageType::RESULT) {
                report = bindings::ParseWorkerResult(message);
                if (!report) {
                    protocol_error = "malformed result message";
                }
                break;
            } else {
                spdlog::debug("Ignoring unexpected message from worker {}", pid);
            }
        }

        if (report || !protocol_error.empty()) {
            break;
        }
        if (status == utils::ReadStatus::CLOSED || status == utils::ReadStatus::FAILED) {
            break;
        }
    }

    if (timed_out || !protocol_error.empty()) {
        kill(pid, SIGKILL);
    }
    utils::ChildExit child = utils::ReapChild(pid, kReapGrace);

    while (diag_open) {
        AppendDiagnostics(diag_read.Get(), diagnostics, diag_open);
        if (diag_open) {
            // Remaining writers are gone once the worker is reaped
            struct pollfd pfd = {diag_read.Get(), POLLIN, 0};
            if (poll(&pfd, 1, 50) <= 0) {
                break;
            }
        }
    }

    SandboxResult result;
    result.metrics = child.reaped ? metrics.StopWithChildUsage(child.usage) : metrics.Stop();

    if (timed_out) {
        result.error = TimeoutMessage(options_.timeout);
        spdlog::warn("⏱ Worker {} exceeded {}ms, killed", pid, options_.timeout.count());
    } else if (report) {
        result.success = report->success;
        if (report->success) {
            result.result = report->result;
        } else {
            result.error = report->error;
            result.stack = report->stack;
        }

        std::lock_guard<std::mutex> lock(console_mutex_);
        console_.insert(console_.end(), report->console.begin(), report->console.end());
    } else if (!protocol_error.empty()) {
        result.error = "Isolated worker protocol error: " + protocol_error;
        spdlog::error("Worker {}: {}", pid, protocol_error);
    } else {
        if (child.reaped && WIFEXITED(child.status) && WEXITSTATUS(child.status) == 0) {
            result.error = "Isolated worker exited without reporting a result";
        } else if (child.reaped) {
            result.error = "Isolated worker " + utils::DescribeExitStatus(child.status);
        } else {
            result.error = "Isolated worker ended unexpectedly";
        }
        if (!diagnostics.empty()) {
            result.stack = diagnostics;
        }
        spdlog::warn("Worker {}: {}", pid, *result.error);
    }

    return result;
}

void IsolatedSandbox::Dispose() {
    if (!disposed_.exchange(true)) {
        spdlog::debug("Isolated sandbox disposed");
    }
}

std::vector<std::string> IsolatedSandbox::GetConsoleOutput() const {
    std::lock_guard<std::mutex> lock(console_mutex_);
    return console_;
}

void IsolatedSandbox::ClearConsoleOutput() {
    std::lock_guard<std::mutex> lock(console_mutex_);
    console_.clear();
}

} // namespace core
} // namespace capsule
