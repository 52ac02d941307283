#pragma once

#include "sconv/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace sconv::io {

/**
 * @brief Ordered, chunked sink for converter output
 *
 * CONTRACT:
 * - write_chunk() either accepts the whole chunk or leaves no partial bytes,
 *   so a failed chunk can be retried as is
 * - The last chunk of a stream carries final = true; nothing may follow it
 * - reset() drops everything written so far and reopens for a new stream
 * - commit() publishes the result and returns where it was delivered
 * - discard() drops everything; calling it more than once is harmless
 */
class DestinationTransport {
public:
    virtual ~DestinationTransport() = default;

    virtual Result<void> open() = 0;
    virtual Result<void> write_chunk(const std::uint8_t* data, std::size_t size, bool final) = 0;
    virtual Result<void> reset() = 0;
    virtual Result<std::string> commit() = 0;
    virtual void discard() = 0;

    virtual std::string describe() const = 0;
};

/**
 * @brief Destination writing to "<target>.part" and renaming on commit
 *
 * When the target exists and overwriting is off, commit() delivers to
 * "name (1).ext", "name (2).ext", and so on. An uncommitted staging file is
 * removed on destruction.
 */
class FileDestination final : public DestinationTransport {
public:
    explicit FileDestination(std::filesystem::path target, bool overwrite_existing = false);
    ~FileDestination() override;

    FileDestination(const FileDestination&) = delete;
    FileDestination& operator=(const FileDestination&) = delete;

    Result<void> open() override;
    Result<void> write_chunk(const std::uint8_t* data, std::size_t size, bool final) override;
    Result<void> reset() override;
    Result<std::string> commit() override;
    void discard() override;

    std::string describe() const override { return target_.string(); }

    const std::filesystem::path& staging_path() const { return staging_; }
    std::uint64_t bytes_written() const { return bytes_written_; }

    /// First free "name (n).ext" variant of @p path, or @p path itself.
    static std::filesystem::path unique_path(const std::filesystem::path& path);

private:
    Result<void> open_staging(std::ios::openmode mode);
    Result<void> rollback_to(std::uint64_t size);

    std::filesystem::path target_;
    std::filesystem::path staging_;
    bool overwrite_existing_;
    std::ofstream stream_;
    std::uint64_t bytes_written_ = 0;
    bool opened_ = false;
    bool finalized_ = false;
    bool committed_ = false;
};

} // namespace sconv::io
