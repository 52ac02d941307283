#include "sconv/pipeline/converter_process.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <sys/wait.h>
#include <unistd.h>

namespace sconv::pipeline {
namespace {

[[noreturn]] void report_exec_failure(int status_fd) {
    const int error = errno;
    // Runs in the forked child: nothing else can be reported if this fails.
    if (::write(status_fd, &error, sizeof(error)) < 0) {
        ::_exit(126);
    }
    ::_exit(127);
}

ExitStatus decode_wait_status(int raw) {
    ExitStatus status;
    if (WIFEXITED(raw)) {
        status.exited = true;
        status.code = WEXITSTATUS(raw);
    } else if (WIFSIGNALED(raw)) {
        status.signal = WTERMSIG(raw);
    }
    return status;
}

pid_t reap(pid_t pid, int& raw) {
    pid_t result;
    do {
        result = ::waitpid(pid, &raw, 0);
    } while (result < 0 && errno == EINTR);
    return result;
}

} // namespace

// ════════════════════════════════════════════════════════
// DiagnosticBuffer
// ════════════════════════════════════════════════════════

DiagnosticBuffer::DiagnosticBuffer(std::size_t limit)
    : limit_(limit) {
}

void DiagnosticBuffer::append(const std::uint8_t* data, std::size_t size) {
    std::lock_guard lock(mutex_);
    total_bytes_ += size;
    if (size >= limit_) {
        bytes_.assign(reinterpret_cast<const char*>(data + size - limit_), limit_);
        return;
    }
    bytes_.append(reinterpret_cast<const char*>(data), size);
    if (bytes_.size() > limit_) {
        bytes_.erase(0, bytes_.size() - limit_);
    }
}

std::string DiagnosticBuffer::tail() const {
    std::lock_guard lock(mutex_);
    return bytes_;
}

std::uint64_t DiagnosticBuffer::total_bytes() const {
    std::lock_guard lock(mutex_);
    return total_bytes_;
}

// ════════════════════════════════════════════════════════
// ConverterProcess
// ════════════════════════════════════════════════════════

PipelineResult<std::unique_ptr<ConverterProcess>> ConverterProcess::launch(const std::vector<std::string>& argv,
                                                                           std::size_t diagnostic_limit) {
    using ProcessPtr = std::unique_ptr<ConverterProcess>;

    if (argv.empty() || argv.front().empty()) {
        return Fail<ProcessPtr>(ErrorKind::ConverterLaunchError, "converter command is empty");
    }

    io::ignore_sigpipe();

    std::array<io::Pipe, 4> pipes;
    for (auto& pipe : pipes) {
        auto created = io::Pipe::create();
        if (created.is_error()) {
            return Fail<ProcessPtr>(ErrorKind::ConverterLaunchError, created.error());
        }
        pipe = std::move(created.value());
    }
    auto& stdin_pipe = pipes[0];
    auto& stdout_pipe = pipes[1];
    auto& stderr_pipe = pipes[2];
    auto& status_pipe = pipes[3];

    // Built before fork: the child must not allocate.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return Fail<ProcessPtr>(ErrorKind::ConverterLaunchError,
                                std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only until exec.
        const int status_fd = status_pipe.write_end.native_handle();
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        if (::sigprocmask(SIG_SETMASK, &empty_mask, nullptr) != 0 ||
            ::signal(SIGPIPE, SIG_DFL) == SIG_ERR ||
            ::setpgid(0, 0) != 0 ||
            ::dup2(stdin_pipe.read_end.native_handle(), STDIN_FILENO) < 0 ||
            ::dup2(stdout_pipe.write_end.native_handle(), STDOUT_FILENO) < 0 ||
            ::dup2(stderr_pipe.write_end.native_handle(), STDERR_FILENO) < 0) {
            report_exec_failure(status_fd);
        }
        ::execvp(args[0], args.data());
        report_exec_failure(status_fd);
    }

    status_pipe.write_end.close();
    stdin_pipe.read_end.close();
    stdout_pipe.write_end.close();
    stderr_pipe.write_end.close();

    // The status pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    auto report = status_pipe.read_end.read_full(reinterpret_cast<std::uint8_t*>(&child_errno),
                                                 sizeof(child_errno));
    if (report.is_error() || report.value() != 0) {
        if (report.is_error()) {
            ::kill(pid, SIGKILL);
        }
        int raw = 0;
        if (reap(pid, raw) < 0) {
            spdlog::warn("Failed to reap converter pid={}: {}", pid, std::strerror(errno));
        }
        const std::string reason = report.is_error()
            ? "could not confirm converter start: " + report.error()
            : "failed to execute '" + argv.front() + "': " + std::strerror(child_errno);
        return Fail<ProcessPtr>(ErrorKind::ConverterLaunchError, reason);
    }

    spdlog::debug("Converter started pid={} command={}", pid, argv.front());
    return Ok(ProcessPtr(new ConverterProcess(pid,
                                              std::move(stdin_pipe.write_end),
                                              std::move(stdout_pipe.read_end),
                                              std::move(stderr_pipe.read_end),
                                              diagnostic_limit)));
}

ConverterProcess::ConverterProcess(pid_t pid,
                                   io::FileDescriptor input,
                                   io::FileDescriptor output,
                                   io::FileDescriptor error,
                                   std::size_t diagnostic_limit)
    : pid_(pid),
      input_(std::move(input)),
      output_(std::move(output)),
      error_(std::move(error)),
      diagnostics_(diagnostic_limit) {
    stderr_thread_ = std::thread([this]() { drain_stderr(); });
}

ConverterProcess::~ConverterProcess() {
    terminate();
    wait();
}

ExitStatus ConverterProcess::wait() {
    {
        std::lock_guard lock(mutex_);
        if (status_) {
            return *status_;
        }
    }

    // Wait without reaping so terminate() cannot race with pid reuse.
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR) {
            break;
        }
    }

    ExitStatus status;
    {
        std::lock_guard lock(mutex_);
        int raw = 0;
        if (reap(pid_, raw) == pid_) {
            status = decode_wait_status(raw);
        } else {
            spdlog::error("Failed to reap converter pid={}: {}", pid_, std::strerror(errno));
            status.exited = true;
            status.code = -1;
        }
        reaped_ = true;
        status_ = status;
    }

    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
    spdlog::debug("Converter finished pid={} status={}", pid_, status.describe());
    return status;
}

void ConverterProcess::terminate() {
    std::lock_guard lock(mutex_);
    if (reaped_) {
        return;
    }
    if (::kill(-pid_, SIGKILL) != 0) {
        if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
            spdlog::warn("Failed to kill converter pid={}: {}", pid_, std::strerror(errno));
        }
    }
}

void ConverterProcess::drain_stderr() {
    std::array<std::uint8_t, 4096> buffer{};
    while (true) {
        auto result = error_.read_some(buffer.data(), buffer.size());
        if (result.is_error()) {
            spdlog::debug("Converter stderr read failed pid={}: {}", pid_, result.error());
            break;
        }
        if (result.value() == 0) {
            break;
        }
        diagnostics_.append(buffer.data(), result.value());
    }
    spdlog::debug("Converter stderr closed pid={} bytes={}", pid_, diagnostics_.total_bytes());
}

} // namespace sconv::pipeline
