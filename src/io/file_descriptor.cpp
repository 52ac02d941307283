#include "sconv/io/file_descriptor.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <unistd.h>

namespace sconv::io {
namespace {

constexpr const char* kBrokenPipe = "broken pipe";

std::string errno_message(const char* what, int error) {
    return std::string(what) + ": " + std::strerror(error);
}

} // namespace

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() {
        std::signal(SIGPIPE, SIG_IGN);
        spdlog::debug("SIGPIPE ignored; pipe writes report EPIPE");
    });
}

bool is_broken_pipe(const std::string& error) {
    return error == kBrokenPipe;
}

FileDescriptor::FileDescriptor()
    : fd_(INVALID_FD_VALUE) {
}

FileDescriptor::FileDescriptor(fd_t fd)
    : fd_(fd) {
}

FileDescriptor::~FileDescriptor() {
    close();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_) {
    other.fd_ = INVALID_FD_VALUE;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = INVALID_FD_VALUE;
    }
    return *this;
}

Result<void> FileDescriptor::write_all(const std::uint8_t* data, std::size_t size) {
    if (fd_ == INVALID_FD_VALUE) {
        return Err<void>(std::string("Descriptor not open"));
    }

    std::size_t written = 0;
    while (written < size) {
        const auto count = ::write(fd_, data + written, size - written);
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE) {
                return Err<void>(std::string(kBrokenPipe));
            }
            return Err<void>(errno_message("write failed", errno));
        }
        written += static_cast<std::size_t>(count);
    }
    return Ok();
}

Result<std::size_t> FileDescriptor::read_some(std::uint8_t* buffer, std::size_t size) {
    if (fd_ == INVALID_FD_VALUE) {
        return Err<std::size_t>(std::string("Descriptor not open"));
    }

    while (true) {
        const auto count = ::read(fd_, buffer, size);
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err<std::size_t>(errno_message("read failed", errno));
        }
        return Ok(static_cast<std::size_t>(count));
    }
}

Result<std::size_t> FileDescriptor::read_full(std::uint8_t* buffer, std::size_t size) {
    std::size_t total = 0;
    while (total < size) {
        auto result = read_some(buffer + total, size - total);
        if (result.is_error()) {
            return result;
        }
        if (result.value() == 0) {
            break;
        }
        total += result.value();
    }
    return Ok(total);
}

void FileDescriptor::close() {
    if (fd_ != INVALID_FD_VALUE) {
        ::close(fd_);
        fd_ = INVALID_FD_VALUE;
    }
}

Result<Pipe> Pipe::create() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Err<Pipe>(errno_message("pipe2 failed", errno));
    }
    Pipe pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
    return Ok(std::move(pipe));
}

} // namespace sconv::io
