#include "sconv/io/origin.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <cctype>

namespace sconv::io {
namespace {

bool is_numeric(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string bracket_if_ipv6(const std::string& host) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]";
    }
    return host;
}

} // namespace

std::string HttpUrl::host_header() const {
    const bool default_port = (tls && port == "443") || (!tls && port == "80");
    if (default_port) {
        return bracket_if_ipv6(host);
    }
    return bracket_if_ipv6(host) + ":" + port;
}

std::string HttpUrl::to_string() const {
    return std::string(tls ? "https://" : "http://") + host_header() + target;
}

Result<HttpUrl> parse_http_url(const std::string& url) {
    HttpUrl parsed;
    std::string rest;
    if (boost::algorithm::istarts_with(url, "https://")) {
        parsed.tls = true;
        rest = url.substr(8);
    } else if (boost::algorithm::istarts_with(url, "http://")) {
        rest = url.substr(7);
    } else {
        return Err<HttpUrl>(std::string("Unsupported URL scheme: ") + url);
    }

    const auto fragment = rest.find('#');
    if (fragment != std::string::npos) {
        rest.erase(fragment);
    }

    const auto path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    if (path_start != std::string::npos) {
        parsed.target = rest.substr(path_start);
        if (parsed.target.front() == '?') {
            parsed.target.insert(parsed.target.begin(), '/');
        }
    }

    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority.erase(0, at + 1);
    }

    std::string port;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return Err<HttpUrl>(std::string("Malformed IPv6 host in URL: ") + url);
        }
        parsed.host = authority.substr(1, close - 1);
        const auto tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                return Err<HttpUrl>(std::string("Malformed host in URL: ") + url);
            }
            port = tail.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            parsed.host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        } else {
            parsed.host = authority;
        }
    }

    if (parsed.host.empty()) {
        return Err<HttpUrl>(std::string("URL has no host: ") + url);
    }
    boost::algorithm::to_lower(parsed.host);

    if (port.empty()) {
        parsed.port = parsed.tls ? "443" : "80";
    } else {
        if (!is_numeric(port) || port.size() > 5 || std::stoul(port) == 0 || std::stoul(port) > 65535) {
            return Err<HttpUrl>(std::string("Invalid port in URL: ") + url);
        }
        parsed.port = port;
    }

    return Ok(std::move(parsed));
}

Result<std::unique_ptr<RemoteOrigin>> make_origin(const std::string& locator,
                                                  std::chrono::milliseconds http_timeout) {
    using OriginPtr = std::unique_ptr<RemoteOrigin>;

    if (locator.empty()) {
        return Err<OriginPtr>(std::string("Source locator is empty"));
    }

    if (boost::algorithm::istarts_with(locator, "http://") ||
        boost::algorithm::istarts_with(locator, "https://")) {
        auto url = parse_http_url(locator);
        if (url.is_error()) {
            return Err<OriginPtr>(url.error());
        }
        return Ok(OriginPtr(new HttpOrigin(std::move(url.value()), http_timeout)));
    }

    std::string path = locator;
    if (boost::algorithm::istarts_with(locator, "file://")) {
        path = locator.substr(7);
    }
    return Ok(OriginPtr(new FileOrigin(path)));
}

} // namespace sconv::io
