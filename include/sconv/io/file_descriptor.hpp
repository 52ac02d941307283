#pragma once

#include "sconv/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace sconv::io {

using fd_t = int;
constexpr fd_t INVALID_FD_VALUE = -1;

/**
 * @brief Owning wrapper around a POSIX file descriptor
 *
 * All descriptors created here are close-on-exec, so a converter spawned by
 * one session never inherits another session's pipe ends.
 */
class FileDescriptor {
public:
    FileDescriptor();
    explicit FileDescriptor(fd_t fd);
    ~FileDescriptor();

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    /// Write every byte or fail; EPIPE is reported as "broken pipe".
    Result<void> write_all(const std::uint8_t* data, std::size_t size);

    /// Single read; 0 means end of stream.
    Result<std::size_t> read_some(std::uint8_t* buffer, std::size_t size);

    /// Read until @p size bytes or end of stream.
    Result<std::size_t> read_full(std::uint8_t* buffer, std::size_t size);

    void close();

    bool is_valid() const { return fd_ != INVALID_FD_VALUE; }
    fd_t native_handle() const { return fd_; }

private:
    fd_t fd_;
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;

    static Result<Pipe> create();
};

/**
 * @brief Make writes to a closed pipe fail with EPIPE instead of raising SIGPIPE
 *
 * Process-wide, applied once.
 */
void ignore_sigpipe();

bool is_broken_pipe(const std::string& error);

} // namespace sconv::io
