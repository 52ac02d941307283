#pragma once

#include "sconv/core/cancellation.hpp"
#include "sconv/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>

namespace sconv::io {

/**
 * @brief Random-access byte source the pipeline pulls its input from
 *
 * read_range() returning fewer bytes than requested (including zero) marks
 * the end of the source. Implementations are used from a single feeder
 * thread at a time.
 */
class RemoteOrigin {
public:
    virtual ~RemoteOrigin() = default;

    /// Total size if the origin can tell without reading the body.
    virtual Result<std::optional<std::uint64_t>> probe_size(const CancellationToken& cancel) = 0;

    virtual Result<std::size_t> read_range(std::uint64_t offset,
                                           std::uint8_t* buffer,
                                           std::size_t length,
                                           const CancellationToken& cancel) = 0;

    virtual std::string describe() const = 0;
};

class FileOrigin final : public RemoteOrigin {
public:
    explicit FileOrigin(std::filesystem::path path);

    Result<std::optional<std::uint64_t>> probe_size(const CancellationToken& cancel) override;
    Result<std::size_t> read_range(std::uint64_t offset,
                                   std::uint8_t* buffer,
                                   std::size_t length,
                                   const CancellationToken& cancel) override;
    std::string describe() const override { return path_.string(); }

private:
    std::filesystem::path path_;
    std::ifstream stream_;
};

struct HttpUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string target = "/";

    std::string host_header() const;
    std::string to_string() const;
};

/**
 * @brief Split an http:// or https:// URL into connection parameters
 *
 * Relative references are not accepted; the fragment is dropped.
 */
Result<HttpUrl> parse_http_url(const std::string& url);

/**
 * @brief HTTP(S) origin reading byte ranges with Range GET requests
 *
 * One keep-alive connection is reused across requests and reopened after a
 * failure. Redirects are followed. Every network operation is bounded by the
 * configured timeout and aborts promptly on cancellation.
 *
 * A server that answers with shorter ranges than requested is asked again
 * for the rest, so read_range() only comes up short at the end of the
 * resource (Content-Range total, 416, or a 200 carrying the whole body).
 */
class HttpOrigin final : public RemoteOrigin {
public:
    static constexpr int kMaxRedirects = 5;

    HttpOrigin(HttpUrl url, std::chrono::milliseconds timeout);
    ~HttpOrigin() override;

    HttpOrigin(const HttpOrigin&) = delete;
    HttpOrigin& operator=(const HttpOrigin&) = delete;

    Result<std::optional<std::uint64_t>> probe_size(const CancellationToken& cancel) override;
    Result<std::size_t> read_range(std::uint64_t offset,
                                   std::uint8_t* buffer,
                                   std::size_t length,
                                   const CancellationToken& cancel) override;
    std::string describe() const override;

private:
    class Connection;

    struct RangeReply {
        std::size_t bytes = 0;
        bool end_of_source = false;
    };

    /// One Range GET; a 206 covering less than asked is not the end of the source.
    Result<RangeReply> fetch_range(std::uint64_t offset,
                                   std::uint8_t* buffer,
                                   std::size_t length,
                                   const CancellationToken& cancel);

    HttpUrl url_;
    std::unique_ptr<Connection> connection_;
};

/**
 * @brief Pick an origin from the locator: http(s) URLs, file:// URLs, or plain paths
 */
Result<std::unique_ptr<RemoteOrigin>> make_origin(const std::string& locator,
                                                  std::chrono::milliseconds http_timeout);

} // namespace sconv::io
