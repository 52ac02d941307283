#include "sconv/io/origin.hpp"

#include <system_error>

namespace sconv::io {
namespace fs = std::filesystem;

FileOrigin::FileOrigin(fs::path path)
    : path_(std::move(path)) {
}

Result<std::optional<std::uint64_t>> FileOrigin::probe_size(const CancellationToken&) {
    std::error_code ec;
    const auto size = fs::file_size(path_, ec);
    if (ec) {
        return Err<std::optional<std::uint64_t>>(
            std::string("Failed to stat source file: ") + path_.string() + ": " + ec.message());
    }
    return Ok(std::optional<std::uint64_t>(size));
}

Result<std::size_t> FileOrigin::read_range(std::uint64_t offset,
                                           std::uint8_t* buffer,
                                           std::size_t length,
                                           const CancellationToken&) {
    if (!stream_.is_open()) {
        stream_.open(path_, std::ios::binary);
        if (!stream_) {
            return Err<std::size_t>(std::string("Failed to open source file: ") + path_.string());
        }
    }

    // A previous short read leaves eof set.
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    if (!stream_) {
        return Err<std::size_t>(std::string("Failed to seek source file: ") + path_.string());
    }

    stream_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(length));
    if (stream_.bad()) {
        return Err<std::size_t>(std::string("Failed to read source file: ") + path_.string());
    }
    return Ok(static_cast<std::size_t>(stream_.gcount()));
}

} // namespace sconv::io
