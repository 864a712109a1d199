/**
 * @file process_utils.hpp
 * @brief POSIX process plumbing for isolated workers
 *
 * File descriptor ownership, interpreter lookup, non-blocking line reads,
 * rlimit application in a forked child and child reaping with a grace
 * period before SIGKILL.
 *
 * @date 2025
 */

#pragma once

#include "capsule/security/security_policy.hpp"

#include <sys/resource.h>
#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace capsule {
namespace utils {

/**
 * @class FileDescriptor
 * @brief Owning wrapper that closes the descriptor on destruction
 */
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { Reset(); }

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.Release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int Get() const { return fd_; }
    bool IsValid() const { return fd_ >= 0; }

    /// Give up ownership without closing
    int Release();

    /// Close the current descriptor (if any) and take ownership of @p fd
    void Reset(int fd = -1);

private:
    int fd_{-1};
};

/**
 * @brief Locate an interpreter binary
 *
 * Paths containing '/' are checked directly. Bare names are looked up in
 * /usr/bin, /usr/local/bin, then each PATH entry.
 *
 * @return Absolute path to an executable file, or std::nullopt
 */
std::optional<std::filesystem::path> ResolveExecutable(const std::string& name);

/**
 * @brief Switch a descriptor to non-blocking mode
 */
bool SetNonBlocking(int fd);

/**
 * @brief Write all of @p data to a stream socket
 *
 * Uses MSG_NOSIGNAL so a vanished peer yields false instead of SIGPIPE.
 * Waits for buffer space on non-blocking sockets, but not past @p deadline.
 */
bool SendAll(int fd, const std::string& data, std::chrono::steady_clock::time_point deadline);

/**
 * @enum ReadStatus
 * @brief Result of one non-blocking read
 */
enum class ReadStatus {
    DATA,         ///< Bytes were appended
    WOULD_BLOCK,  ///< Nothing available right now
    CLOSED,       ///< Peer closed its end
    FAILED        ///< Read error
};

/**
 * @brief Append whatever is currently readable from @p fd to @p buffer
 */
ReadStatus ReadAvailable(int fd, std::string& buffer);

/**
 * @brief Pop the next complete '\n'-terminated line from @p buffer
 * @return Line without the terminator, or std::nullopt if none is complete
 */
std::optional<std::string> TakeLine(std::string& buffer);

/**
 * @brief Apply worker rlimits in a freshly forked child
 *
 * Async-signal-safe; failures are ignored because the child has no way to
 * report them before exec.
 */
void ApplyResourceLimits(const security::ResourceLimits& limits) noexcept;

/**
 * @brief Close every descriptor >= @p first_fd in the calling process
 *
 * Async-signal-safe.
 */
void CloseDescriptorsFrom(int first_fd) noexcept;

/**
 * @struct ChildExit
 * @brief How a reaped child ended
 */
struct ChildExit {
    bool reaped{false};           ///< wait4() collected the child
    bool killed{false};           ///< SIGKILL was sent after the grace period
    int status{0};                ///< Raw wait status
    struct rusage usage {};       ///< Resource usage of the child
};

/**
 * @brief Wait for a child, killing it if it outlives @p grace
 */
ChildExit ReapChild(pid_t pid, std::chrono::milliseconds grace);

/**
 * @brief Human-readable description of a wait status
 * @return "exited with code N", "terminated by signal N (NAME)", ...
 */
std::string DescribeExitStatus(int status);

} // namespace utils
} // namespace capsule
