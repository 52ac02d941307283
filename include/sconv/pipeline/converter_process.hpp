#pragma once

#include "sconv/core/error.hpp"
#include "sconv/io/file_descriptor.hpp"
#include "sconv/pipeline/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace sconv::pipeline {

/**
 * @brief Keeps the most recent bytes written to it, up to a fixed limit
 */
class DiagnosticBuffer {
public:
    explicit DiagnosticBuffer(std::size_t limit);

    void append(const std::uint8_t* data, std::size_t size);

    std::string tail() const;
    std::uint64_t total_bytes() const;

private:
    mutable std::mutex mutex_;
    std::size_t limit_;
    std::string bytes_;
    std::uint64_t total_bytes_ = 0;
};

/**
 * @brief One running converter with stdin, stdout and stderr on pipes
 *
 * The child runs in its own process group so terminate() also reaches
 * anything it spawned. stderr is drained on a private thread into a
 * DiagnosticBuffer.
 *
 * THREAD SAFETY:
 * - input() is used by the feeder thread, output() by the drainer thread
 * - terminate() may race with wait(); it never signals a reaped pid
 */
class ConverterProcess {
public:
    /**
     * @brief Spawn @p argv (argv[0] is looked up in PATH)
     *
     * Returns only once exec has succeeded; an exec failure in the child is
     * reported as ConverterLaunchError.
     */
    static PipelineResult<std::unique_ptr<ConverterProcess>> launch(const std::vector<std::string>& argv,
                                                                    std::size_t diagnostic_limit);

    ~ConverterProcess();

    ConverterProcess(const ConverterProcess&) = delete;
    ConverterProcess& operator=(const ConverterProcess&) = delete;

    io::FileDescriptor& input() { return input_; }
    io::FileDescriptor& output() { return output_; }

    pid_t pid() const noexcept { return pid_; }

    /// Block until the process exits, reap it, and collect stderr.
    ExitStatus wait();

    /// SIGKILL the process group unless it has already been reaped.
    void terminate();

    std::string diagnostics() const { return diagnostics_.tail(); }

private:
    ConverterProcess(pid_t pid,
                     io::FileDescriptor input,
                     io::FileDescriptor output,
                     io::FileDescriptor error,
                     std::size_t diagnostic_limit);

    void drain_stderr();

    pid_t pid_;
    io::FileDescriptor input_;
    io::FileDescriptor output_;
    io::FileDescriptor error_;
    DiagnosticBuffer diagnostics_;
    std::thread stderr_thread_;

    std::mutex mutex_;
    bool reaped_ = false;
    std::optional<ExitStatus> status_;
};

} // namespace sconv::pipeline
