#include "sconv/io/origin.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <limits>
#include <optional>
#include <string_view>

namespace sconv::io {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr const char* kUserAgent = "streamconv";
constexpr const char* kCancelled = "cancelled";
constexpr int kHttpVersion = 11;

bool is_redirect(http::status status) {
    switch (status) {
        case http::status::moved_permanently:
        case http::status::found:
        case http::status::see_other:
        case http::status::temporary_redirect:
        case http::status::permanent_redirect:
            return true;
        default:
            return false;
    }
}

std::string status_text(const http::response_header<>& header) {
    return "HTTP " + std::to_string(header.result_int()) + " " + std::string(header.reason());
}

struct ContentRange {
    std::uint64_t first = 0;
    std::uint64_t last = 0;
    std::optional<std::uint64_t> total;
};

bool parse_u64(std::string_view text, std::uint64_t& value) {
    if (text.empty()) {
        return false;
    }
    const auto* end = text.data() + text.size();
    const auto result = std::from_chars(text.data(), end, value);
    return result.ec == std::errc() && result.ptr == end;
}

// "bytes 1048576-2097151/7340032"; the total may be "*".
std::optional<ContentRange> parse_content_range(std::string_view value) {
    constexpr std::string_view prefix = "bytes ";
    if (value.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }
    value.remove_prefix(prefix.size());

    const auto dash = value.find('-');
    const auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    ContentRange range;
    if (!parse_u64(value.substr(0, dash), range.first) ||
        !parse_u64(value.substr(dash + 1, slash - dash - 1), range.last) ||
        range.last < range.first) {
        return std::nullopt;
    }

    const auto total = value.substr(slash + 1);
    if (total != "*") {
        std::uint64_t size = 0;
        if (!parse_u64(total, size) || size <= range.last) {
            return std::nullopt;
        }
        range.total = size;
    }
    return range;
}

Result<void> follow_redirect(HttpUrl& url, const http::response_header<>& header) {
    const auto it = header.find(http::field::location);
    if (it == header.end() || it->value().empty()) {
        return Err<void>(status_text(header) + " without Location header");
    }

    std::string location(it->value());
    if (location.rfind("//", 0) == 0) {
        location = (url.tls ? "https:" : "http:") + location;
    } else if (location.front() == '/') {
        url.target = location;
        return Ok();
    }

    auto parsed = parse_http_url(location);
    if (parsed.is_error()) {
        return Err<void>(std::string("Bad redirect: ") + parsed.error());
    }
    url = std::move(parsed.value());
    return Ok();
}

} // namespace

/**
 * @brief One plain or TLS connection driven on a private io_context
 *
 * Async operations are started and then run in short slices so that the
 * cancellation token and the per-operation deadline are checked while the
 * operation is pending.
 */
class HttpOrigin::Connection {
public:
    explicit Connection(std::chrono::milliseconds timeout)
        : tls_context_(ssl::context::tls_client),
          resolver_(ioc_),
          timeout_(timeout) {
        boost::system::error_code ec;
        tls_context_.set_default_verify_paths(ec);
        if (ec) {
            spdlog::warn("TLS trust store unavailable: {}", ec.message());
        }
        tls_context_.set_verify_mode(ssl::verify_peer);
    }

    ~Connection() {
        close();
    }

    Result<void> ensure_connected(const HttpUrl& url, const CancellationToken& cancel) {
        if (is_open_for(url)) {
            return Ok();
        }
        return connect(url, cancel);
    }

    template<typename Parser>
    Result<void> send(http::request<http::empty_body>& request,
                      Parser& parser,
                      const CancellationToken& cancel) {
        boost::system::error_code ec;
        with_stream([&](auto& stream) {
            http::async_write(stream, request,
                [&ec](const boost::system::error_code& e, std::size_t) { ec = e; });
        });
        if (auto res = drive(cancel, ec, "write request"); res.is_error()) {
            return res;
        }

        with_stream([&](auto& stream) {
            http::async_read_header(stream, buffer_, parser,
                [&ec](const boost::system::error_code& e, std::size_t) { ec = e; });
        });
        return drive(cancel, ec, "read response header");
    }

    /// Read the body straight into @p buffer; more than @p length bytes is an error.
    Result<std::size_t> read_body(http::response_parser<http::buffer_body>& parser,
                                  std::uint8_t* buffer,
                                  std::size_t length,
                                  const CancellationToken& cancel) {
        std::size_t received = 0;
        while (!parser.is_done()) {
            if (received == length) {
                close();
                return Err<std::size_t>(std::string("Response body exceeds requested range"));
            }

            auto& body = parser.get().body();
            body.data = buffer + received;
            body.size = length - received;

            boost::system::error_code ec;
            with_stream([&](auto& stream) {
                http::async_read(stream, buffer_, parser,
                    [&ec](const boost::system::error_code& e, std::size_t) {
                        ec = (e == http::error::need_buffer) ? boost::system::error_code{} : e;
                    });
            });
            if (auto res = drive(cancel, ec, "read response body"); res.is_error()) {
                return Err<std::size_t>(res.error());
            }
            received = length - body.size;
        }

        if (!parser.get().keep_alive()) {
            close();
        }
        return Ok(received);
    }

    void finish(bool keep_alive) {
        if (!keep_alive) {
            close();
        }
    }

    void close() {
        if (tls_) {
            beast::get_lowest_layer(*tls_).close();
            tls_.reset();
        }
        if (plain_) {
            plain_->close();
            plain_.reset();
        }
        buffer_.clear();
        connected_url_.reset();
    }

private:
    bool is_open_for(const HttpUrl& url) const {
        return connected_url_ &&
               connected_url_->tls == url.tls &&
               connected_url_->host == url.host &&
               connected_url_->port == url.port;
    }

    template<typename Fn>
    void with_stream(Fn&& fn) {
        if (tls_) {
            fn(*tls_);
        } else {
            fn(*plain_);
        }
    }

    beast::tcp_stream& lowest_layer() {
        return tls_ ? beast::get_lowest_layer(*tls_) : *plain_;
    }

    Result<void> connect(const HttpUrl& url, const CancellationToken& cancel) {
        close();

        boost::system::error_code ec;
        tcp::resolver::results_type endpoints;
        resolver_.async_resolve(url.host, url.port,
            [&](const boost::system::error_code& e, tcp::resolver::results_type results) {
                ec = e;
                endpoints = std::move(results);
            });
        if (auto res = drive(cancel, ec, "resolve " + url.host); res.is_error()) {
            return res;
        }

        if (url.tls) {
            tls_.emplace(ioc_, tls_context_);
            boost::system::error_code addr_ec;
            net::ip::make_address(url.host, addr_ec);
            if (addr_ec && !SSL_set_tlsext_host_name(tls_->native_handle(), url.host.c_str())) {
                close();
                return Err<void>(std::string("Failed to set TLS server name for ") + url.host);
            }
            tls_->set_verify_callback(ssl::host_name_verification(url.host));
        } else {
            plain_.emplace(ioc_);
        }

        lowest_layer().async_connect(endpoints,
            [&ec](const boost::system::error_code& e, const tcp::endpoint&) { ec = e; });
        if (auto res = drive(cancel, ec, "connect " + url.host_header()); res.is_error()) {
            return res;
        }

        if (tls_) {
            tls_->async_handshake(ssl::stream_base::client,
                [&ec](const boost::system::error_code& e) { ec = e; });
            if (auto res = drive(cancel, ec, "TLS handshake with " + url.host); res.is_error()) {
                return res;
            }
        }

        connected_url_ = url;
        spdlog::debug("HTTP connected host={} port={} tls={}", url.host, url.port, url.tls);
        return Ok();
    }

    Result<void> drive(const CancellationToken& cancel,
                       const boost::system::error_code& ec,
                       const std::string& what) {
        const auto deadline = std::chrono::steady_clock::now() + timeout_;
        ioc_.restart();
        while (!ioc_.stopped()) {
            ioc_.run_for(kPollInterval);
            if (ioc_.stopped()) {
                break;
            }

            const bool cancelled = cancel.is_cancelled();
            if (cancelled || std::chrono::steady_clock::now() >= deadline) {
                abort_pending();
                ioc_.run();
                close();
                if (cancelled) {
                    return Err<void>(std::string(kCancelled));
                }
                return Err<void>(what + " timed out after " + std::to_string(timeout_.count()) + "ms");
            }
        }

        if (ec) {
            close();
            return Err<void>(what + " failed: " + ec.message());
        }
        return Ok();
    }

    void abort_pending() {
        resolver_.cancel();
        if (tls_ || plain_) {
            lowest_layer().close();
        }
    }

    net::io_context ioc_;
    ssl::context tls_context_;
    tcp::resolver resolver_;
    std::optional<beast::tcp_stream> plain_;
    std::optional<beast::ssl_stream<beast::tcp_stream>> tls_;
    beast::flat_buffer buffer_;
    std::chrono::milliseconds timeout_;
    std::optional<HttpUrl> connected_url_;
};

HttpOrigin::HttpOrigin(HttpUrl url, std::chrono::milliseconds timeout)
    : url_(std::move(url)),
      connection_(std::make_unique<Connection>(timeout)) {
}

HttpOrigin::~HttpOrigin() = default;

std::string HttpOrigin::describe() const {
    return url_.to_string();
}

Result<std::optional<std::uint64_t>> HttpOrigin::probe_size(const CancellationToken& cancel) {
    using SizeResult = std::optional<std::uint64_t>;

    for (int redirects = 0; redirects <= kMaxRedirects; ++redirects) {
        if (auto res = connection_->ensure_connected(url_, cancel); res.is_error()) {
            return Err<SizeResult>(res.error());
        }

        http::request<http::empty_body> request{http::verb::head, url_.target, kHttpVersion};
        request.set(http::field::host, url_.host_header());
        request.set(http::field::user_agent, kUserAgent);

        http::response_parser<http::empty_body> parser;
        parser.skip(true);
        if (auto res = connection_->send(request, parser, cancel); res.is_error()) {
            return Err<SizeResult>(res.error());
        }

        const auto& header = parser.get().base();
        if (is_redirect(header.result())) {
            connection_->close();
            if (auto res = follow_redirect(url_, header); res.is_error()) {
                return Err<SizeResult>(res.error());
            }
            spdlog::debug("HTTP redirect to {}", url_.to_string());
            continue;
        }

        connection_->finish(parser.get().keep_alive());
        if (header.result() != http::status::ok) {
            spdlog::debug("HEAD {} returned {}; size unknown", url_.to_string(), status_text(header));
            return Ok(SizeResult{});
        }

        const auto length = parser.content_length();
        if (!length) {
            return Ok(SizeResult{});
        }
        return Ok(SizeResult(*length));
    }
    return Err<SizeResult>(std::string("Too many redirects from ") + url_.to_string());
}

Result<std::size_t> HttpOrigin::read_range(std::uint64_t offset,
                                           std::uint8_t* buffer,
                                           std::size_t length,
                                           const CancellationToken& cancel) {
    // Servers may cap the size of a range; keep asking until the chunk is
    // full or the source ends.
    std::size_t filled = 0;
    while (filled < length) {
        auto reply = fetch_range(offset + filled, buffer + filled, length - filled, cancel);
        if (reply.is_error()) {
            return Err<std::size_t>(reply.error());
        }

        filled += reply.value().bytes;
        if (reply.value().end_of_source || reply.value().bytes == 0) {
            break;
        }
        if (filled < length) {
            spdlog::debug("HTTP range short url={} offset={} received={} wanted={}",
                          url_.to_string(), offset, filled, length);
        }
    }
    return Ok(filled);
}

Result<HttpOrigin::RangeReply> HttpOrigin::fetch_range(std::uint64_t offset,
                                                       std::uint8_t* buffer,
                                                       std::size_t length,
                                                       const CancellationToken& cancel) {
    for (int redirects = 0; redirects <= kMaxRedirects; ++redirects) {
        if (auto res = connection_->ensure_connected(url_, cancel); res.is_error()) {
            return Err<RangeReply>(res.error());
        }

        http::request<http::empty_body> request{http::verb::get, url_.target, kHttpVersion};
        request.set(http::field::host, url_.host_header());
        request.set(http::field::user_agent, kUserAgent);
        request.set(http::field::range,
                    "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1));

        http::response_parser<http::buffer_body> parser;
        // Body size is bounded by read_body(); an unset limit rejects any body on older Beast.
        parser.body_limit(std::numeric_limits<std::uint64_t>::max());
        if (auto res = connection_->send(request, parser, cancel); res.is_error()) {
            return Err<RangeReply>(res.error());
        }

        const auto& header = parser.get().base();
        const auto status = header.result();
        spdlog::debug("HTTP GET url={} offset={} length={} status={}",
                      url_.to_string(), offset, length, header.result_int());

        if (is_redirect(status)) {
            connection_->close();
            if (auto res = follow_redirect(url_, header); res.is_error()) {
                return Err<RangeReply>(res.error());
            }
            continue;
        }

        std::optional<ContentRange> range;
        switch (status) {
            case http::status::partial_content: {
                const auto it = header.find(http::field::content_range);
                if (it == header.end()) {
                    break;
                }
                const std::string value(it->value());
                range = parse_content_range(value);
                if (!range || range->first != offset || range->last >= offset + length) {
                    connection_->close();
                    return Err<RangeReply>("Content-Range '" + value + "' does not match requested bytes " +
                                           std::to_string(offset) + "-" + std::to_string(offset + length - 1));
                }
                break;
            }
            case http::status::ok:
                // Range ignored: only usable when the whole body fits in the first chunk.
                if (offset != 0) {
                    connection_->close();
                    return Err<RangeReply>(std::string("Server ignored Range request at offset ") +
                                           std::to_string(offset));
                }
                break;
            case http::status::range_not_satisfiable:
                connection_->close();
                return Ok(RangeReply{0, true});
            default:
                connection_->close();
                return Err<RangeReply>(status_text(header) + " from " + url_.to_string());
        }

        auto body = connection_->read_body(parser, buffer, length, cancel);
        if (body.is_error()) {
            return Err<RangeReply>(body.error());
        }

        RangeReply reply{body.value(), false};
        if (status == http::status::ok) {
            reply.end_of_source = true;
        } else if (range) {
            if (reply.bytes != range->last - range->first + 1) {
                connection_->close();
                return Err<RangeReply>(std::string("Body length does not match Content-Range at offset ") +
                                       std::to_string(offset));
            }
            reply.end_of_source = range->total ? offset + reply.bytes >= *range->total
                                               : reply.bytes < length;
        } else {
            reply.end_of_source = reply.bytes < length;
        }
        return Ok(reply);
    }
    return Err<RangeReply>(std::string("Too many redirects from ") + url_.to_string());
}

} // namespace sconv::io
