/**
 * @file process_utils.cpp
 * @brief POSIX process plumbing for isolated workers (Linux)
 *
 * @date 2025
 */

#include "capsule/utils/process_utils.hpp"
#include "capsule/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <vector>

namespace capsule {
namespace utils {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(5);

bool IsExecutableFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

void SetLimit(int resource, std::uint64_t value) noexcept {
    struct rlimit limit;
    limit.rlim_cur = static_cast<rlim_t>(value);
    limit.rlim_max = static_cast<rlim_t>(value);
    setrlimit(resource, &limit);
}

} // anonymous namespace

// ============================================================================
// FILE DESCRIPTORS
// ============================================================================

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

int FileDescriptor::Release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void FileDescriptor::Reset(int fd) {
    if (fd_ >= 0) {
        close(fd_);
    }
    fd_ = fd;
}

bool SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        spdlog::error("Failed to make fd {} non-blocking: {}", fd, std::strerror(errno));
        return false;
    }
    return true;
}

// ============================================================================
// INTERPRETER LOOKUP
// ============================================================================

std::optional<std::filesystem::path> ResolveExecutable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string::npos) {
        std::filesystem::path candidate(name);
        if (IsExecutableFile(candidate)) {
            std::error_code ec;
            auto absolute = std::filesystem::absolute(candidate, ec);
            return ec ? candidate : absolute;
        }
        return std::nullopt;
    }

    std::vector<std::filesystem::path> directories = {"/usr/bin", "/usr/local/bin"};
    if (const char* path_env = std::getenv("PATH")) {
        for (const auto& entry : StringUtils::Split(path_env, ':')) {
            directories.emplace_back(entry);
        }
    }

    for (const auto& directory : directories) {
        auto candidate = directory / name;
        if (IsExecutableFile(candidate)) {
            return candidate;
        }
    }

    spdlog::warn("Executable not found: {}", name);
    return std::nullopt;
}

// ============================================================================
// STREAM I/O
// ============================================================================

bool SendAll(int fd, const std::string& data, std::chrono::steady_clock::time_point deadline) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n >= 0) {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            spdlog::debug("send() on fd {} failed: {}", fd, std::strerror(errno));
            return false;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            spdlog::warn("Timed out writing {} bytes to fd {}", data.size() - sent, fd);
            return false;
        }
        struct pollfd pfd = {fd, POLLOUT, 0};
        poll(&pfd, 1, static_cast<int>(remaining.count()));
    }
    return true;
}

ReadStatus ReadAvailable(int fd, std::string& buffer) {
    std::array<char, 4096> chunk;
    bool got_data = false;

    while (true) {
        ssize_t n = read(fd, chunk.data(), chunk.size());
        if (n > 0) {
            buffer.append(chunk.data(), static_cast<std::size_t>(n));
            got_data = true;
            continue;
        }
        if (n == 0) {
            return got_data ? ReadStatus::DATA : ReadStatus::CLOSED;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return got_data ? ReadStatus::DATA : ReadStatus::WOULD_BLOCK;
        }
        return got_data ? ReadStatus::DATA : ReadStatus::FAILED;
    }
}

std::optional<std::string> TakeLine(std::string& buffer) {
    auto newline = buffer.find('\n');
    if (newline == std::string::npos) {
        return std::nullopt;
    }
    std::string line = buffer.substr(0, newline);
    buffer.erase(0, newline + 1);
    return line;
}

// ============================================================================
// CHILD SIDE
// ============================================================================

void ApplyResourceLimits(const security::ResourceLimits& limits) noexcept {
    if (limits.address_space_bytes > 0) {
        SetLimit(RLIMIT_AS, limits.address_space_bytes);
    }
    if (limits.cpu_seconds > 0) {
        SetLimit(RLIMIT_CPU, limits.cpu_seconds);
    }
    SetLimit(RLIMIT_FSIZE, limits.file_size_bytes);
    SetLimit(RLIMIT_CORE, limits.core_size_bytes);
    if (limits.open_files > 0) {
        SetLimit(RLIMIT_NOFILE, limits.open_files);
    }
}

void CloseDescriptorsFrom(int first_fd) noexcept {
#ifdef SYS_close_range
    if (syscall(SYS_close_range, static_cast<unsigned int>(first_fd), ~0U, 0U) == 0) {
        return;
    }
#endif
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) {
        max_fd = 65536;
    }
    for (int fd = first_fd; fd < max_fd; ++fd) {
        close(fd);
    }
}

// ============================================================================
// REAPING
// ============================================================================

ChildExit ReapChild(pid_t pid, std::chrono::milliseconds grace) {
    ChildExit child;
    const auto deadline = std::chrono::steady_clock::now() + grace;

    while (true) {
        pid_t result = wait4(pid, &child.status, WNOHANG, &child.usage);
        if (result == pid) {
            child.reaped = true;
            return child;
        }
        if (result < 0 && errno != EINTR) {
            spdlog::error("wait4({}) failed: {}", pid, std::strerror(errno));
            return child;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }

    spdlog::warn("Worker {} did not exit within {}ms, sending SIGKILL", pid, grace.count());
    kill(pid, SIGKILL);
    child.killed = true;

    while (true) {
        pid_t result = wait4(pid, &child.status, 0, &child.usage);
        if (result == pid) {
            child.reaped = true;
            break;
        }
        if (result < 0 && errno != EINTR) {
            spdlog::error("wait4({}) failed after SIGKILL: {}", pid, std::strerror(errno));
            break;
        }
    }
    return child;
}

std::string DescribeExitStatus(int status) {
    if (WIFEXITED(status)) {
        return "exited with code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        int signal_number = WTERMSIG(status);
        const char* name = strsignal(signal_number);
        return "terminated by signal " + std::to_string(signal_number) +
               (name ? " (" + std::string(name) + ")" : std::string());
    }
    return "ended with status " + std::to_string(status);
}

} // namespace utils
} // namespace capsule
