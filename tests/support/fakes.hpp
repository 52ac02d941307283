#pragma once

#include "sconv/core/cancellation.hpp"
#include "sconv/core/result.hpp"
#include "sconv/io/destination.hpp"
#include "sconv/io/origin.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace sconv::test_support {

namespace fs = std::filesystem;

inline fs::path create_temp_dir(const std::string& prefix) {
    static std::atomic<std::uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = fs::temp_directory_path() /
                   (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

inline void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

/// Deterministic, non-repeating-looking payload of @p size bytes.
inline std::string make_payload(std::size_t size) {
    std::string data(size, '\0');
    std::uint32_t state = 2463534242u;
    for (auto& c : data) {
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        c = static_cast<char>(state & 0xff);
    }
    return data;
}

/**
 * @brief In-memory origin with fault injection
 *
 * fail_from_request: every request with index >= n (0-based) fails.
 * transient_failures: the first n requests fail, later ones succeed.
 */
class MemoryOrigin final : public io::RemoteOrigin {
public:
    explicit MemoryOrigin(std::string data) : data_(std::move(data)) {}

    void set_probe_result(std::optional<std::uint64_t> size) { probe_ = size; probe_set_ = true; }
    void fail_probe() { probe_fails_ = true; }
    void fail_from_request(std::size_t index) { fail_from_ = index; }
    void transient_failures(std::size_t count) { transient_ = count; }

    Result<std::optional<std::uint64_t>> probe_size(const CancellationToken&) override {
        if (probe_fails_) {
            return Err<std::optional<std::uint64_t>>(std::string("probe refused"));
        }
        if (probe_set_) {
            return Ok(probe_);
        }
        return Ok(std::optional<std::uint64_t>(data_.size()));
    }

    Result<std::size_t> read_range(std::uint64_t offset,
                                   std::uint8_t* buffer,
                                   std::size_t length,
                                   const CancellationToken&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto index = requests_++;
        max_request_ = std::max(max_request_, length);
        if (fail_from_ && index >= *fail_from_) {
            return Err<std::size_t>(std::string("injected read failure"));
        }
        if (transient_ > 0) {
            --transient_;
            return Err<std::size_t>(std::string("injected transient failure"));
        }
        if (offset >= data_.size()) {
            return Ok(std::size_t{0});
        }
        const auto count = std::min<std::size_t>(length, data_.size() - offset);
        std::memcpy(buffer, data_.data() + offset, count);
        return Ok(count);
    }

    std::string describe() const override { return "memory://origin"; }

    std::size_t requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::size_t max_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_request_;
    }

private:
    std::string data_;
    std::optional<std::uint64_t> probe_;
    bool probe_set_ = false;
    bool probe_fails_ = false;
    std::optional<std::size_t> fail_from_;
    std::size_t transient_ = 0;

    mutable std::mutex mutex_;
    std::size_t requests_ = 0;
    std::size_t max_request_ = 0;
};

/**
 * @brief In-memory destination recording every call
 *
 * reject_writes: the next n write_chunk() calls fail without storing bytes.
 */
class MemoryDestination final : public io::DestinationTransport {
public:
    void reject_writes(std::size_t count) { rejections_ = count; }
    void fail_reset() { reset_fails_ = true; }

    Result<void> open() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++opens_;
        open_ = true;
        data_.clear();
        return Ok();
    }

    Result<void> write_chunk(const std::uint8_t* data, std::size_t size, bool final) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++write_calls_;
        if (!open_ || finalized_) {
            return Err<void>(std::string("write outside an open stream"));
        }
        if (rejections_ > 0) {
            --rejections_;
            return Err<void>(std::string("injected write failure"));
        }
        data_.append(reinterpret_cast<const char*>(data), size);
        max_chunk_ = std::max(max_chunk_, size);
        finalized_ = final;
        if (final) {
            ++final_chunks_;
        }
        return Ok();
    }

    Result<void> reset() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reset_fails_) {
            return Err<void>(std::string("injected reset failure"));
        }
        ++resets_;
        data_.clear();
        finalized_ = false;
        return Ok();
    }

    Result<std::string> commit() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!finalized_) {
            return Err<std::string>(std::string("commit before final chunk"));
        }
        committed_ = true;
        open_ = false;
        return Ok(std::string("memory://committed"));
    }

    void discard() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++discards_;
        data_.clear();
        open_ = false;
        finalized_ = false;
    }

    std::string describe() const override { return "memory://destination"; }

    std::string data() const { std::lock_guard<std::mutex> lock(mutex_); return data_; }
    bool committed() const { std::lock_guard<std::mutex> lock(mutex_); return committed_; }
    std::size_t resets() const { std::lock_guard<std::mutex> lock(mutex_); return resets_; }
    std::size_t discards() const { std::lock_guard<std::mutex> lock(mutex_); return discards_; }
    std::size_t final_chunks() const { std::lock_guard<std::mutex> lock(mutex_); return final_chunks_; }
    std::size_t write_calls() const { std::lock_guard<std::mutex> lock(mutex_); return write_calls_; }
    std::size_t max_chunk() const { std::lock_guard<std::mutex> lock(mutex_); return max_chunk_; }

private:
    mutable std::mutex mutex_;
    std::string data_;
    bool open_ = false;
    bool finalized_ = false;
    bool committed_ = false;
    bool reset_fails_ = false;
    std::size_t rejections_ = 0;
    std::size_t opens_ = 0;
    std::size_t resets_ = 0;
    std::size_t discards_ = 0;
    std::size_t final_chunks_ = 0;
    std::size_t write_calls_ = 0;
    std::size_t max_chunk_ = 0;
};

} // namespace sconv::test_support
