#include "sconv/io/destination.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace sconv::io {
namespace fs = std::filesystem;

namespace {

Result<void> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(std::string("Failed to create directory: ") + parent.string());
    }
    return Ok();
}

} // namespace

FileDestination::FileDestination(fs::path target, bool overwrite_existing)
    : target_(std::move(target)),
      staging_(target_.string() + ".part"),
      overwrite_existing_(overwrite_existing) {
}

FileDestination::~FileDestination() {
    if (!committed_) {
        discard();
    }
}

Result<void> FileDestination::open() {
    if (auto res = ensure_parent_exists(staging_); res.is_error()) {
        return res;
    }
    if (auto res = open_staging(std::ios::binary | std::ios::trunc); res.is_error()) {
        return res;
    }
    opened_ = true;
    committed_ = false;
    spdlog::debug("Destination opened staging={}", staging_.string());
    return Ok();
}

Result<void> FileDestination::write_chunk(const std::uint8_t* data, std::size_t size, bool final) {
    if (!opened_ || committed_) {
        return Err<void>(std::string("Destination not open: ") + target_.string());
    }
    if (finalized_) {
        return Err<void>(std::string("Chunk received after final chunk: ") + target_.string());
    }

    const auto before = bytes_written_;
    stream_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    stream_.flush();
    if (!stream_) {
        if (auto res = rollback_to(before); res.is_error()) {
            return Err<void>(std::string("Failed to write chunk and roll back: ") + res.error());
        }
        return Err<void>(std::string("Failed to write chunk to ") + staging_.string());
    }

    bytes_written_ += size;
    if (final) {
        stream_.close();
        finalized_ = true;
    }
    return Ok();
}

Result<void> FileDestination::reset() {
    if (!opened_ || committed_) {
        return Err<void>(std::string("Destination not open: ") + target_.string());
    }
    stream_.close();
    if (auto res = open_staging(std::ios::binary | std::ios::trunc); res.is_error()) {
        return res;
    }
    spdlog::debug("Destination reset staging={}", staging_.string());
    return Ok();
}

Result<std::string> FileDestination::commit() {
    if (!opened_ || committed_) {
        return Err<std::string>(std::string("Destination not open: ") + target_.string());
    }
    if (!finalized_) {
        return Err<std::string>(std::string("Commit before final chunk: ") + target_.string());
    }

    const fs::path delivered = overwrite_existing_ ? target_ : unique_path(target_);
    std::error_code ec;
    fs::rename(staging_, delivered, ec);
    if (ec) {
        return Err<std::string>(std::string("Failed to move staging file to ") + delivered.string() +
                                ": " + ec.message());
    }

    committed_ = true;
    opened_ = false;
    spdlog::debug("Destination committed path={} bytes={}", delivered.string(), bytes_written_);
    return Ok(delivered.string());
}

void FileDestination::discard() {
    stream_.close();
    opened_ = false;
    finalized_ = false;

    std::error_code ec;
    const bool removed = fs::remove(staging_, ec);
    if (ec) {
        spdlog::warn("Failed to remove staging file {}: {}", staging_.string(), ec.message());
    } else if (removed) {
        spdlog::debug("Destination discarded staging={}", staging_.string());
    }
}

fs::path FileDestination::unique_path(const fs::path& path) {
    if (!fs::exists(path)) {
        return path;
    }

    const auto parent = path.parent_path();
    const auto stem = path.stem().string();
    const auto extension = path.extension().string();
    for (unsigned counter = 1;; ++counter) {
        const auto candidate = parent / (stem + " (" + std::to_string(counter) + ")" + extension);
        if (!fs::exists(candidate)) {
            return candidate;
        }
    }
}

Result<void> FileDestination::open_staging(std::ios::openmode mode) {
    stream_.clear();
    stream_.open(staging_, mode);
    if (!stream_) {
        return Err<void>(std::string("Failed to open staging file: ") + staging_.string());
    }
    bytes_written_ = 0;
    finalized_ = false;
    return Ok();
}

Result<void> FileDestination::rollback_to(std::uint64_t size) {
    stream_.close();
    std::error_code ec;
    fs::resize_file(staging_, size, ec);
    if (ec) {
        return Err<void>(std::string("Failed to truncate staging file: ") + ec.message());
    }
    stream_.clear();
    stream_.open(staging_, std::ios::binary | std::ios::app);
    if (!stream_) {
        return Err<void>(std::string("Failed to reopen staging file: ") + staging_.string());
    }
    return Ok();
}

} // namespace sconv::io
