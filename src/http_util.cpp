#include "http_util.hpp"

#include <chrono>

namespace hazard {

UrlParts split_url(const std::string& url) {
    UrlParts parts;
    std::string rest = url;
    std::string scheme = "http://";
    auto sep = rest.find("://");
    if (sep != std::string::npos) {
        scheme = rest.substr(0, sep + 3);
        rest = rest.substr(sep + 3);
    }
    auto slash = rest.find('/');
    if (slash == std::string::npos) {
        parts.origin = scheme + rest;
    } else {
        parts.origin = scheme + rest.substr(0, slash);
        parts.path = rest.substr(slash);
    }
    while (!parts.path.empty() && parts.path.back() == '/') parts.path.pop_back();
    return parts;
}

std::string join_path(const std::string& base, const std::string& tail) {
    if (tail.empty()) return base.empty() ? "/" : base;
    if (tail.front() == '/') return base + tail;
    return base + "/" + tail;
}

std::unique_ptr<httplib::Client> make_client(const std::string& origin, int timeout_ms) {
    auto cli = std::make_unique<httplib::Client>(origin);
    const auto timeout = std::chrono::milliseconds(timeout_ms > 0 ? timeout_ms : 1000);
    cli->set_connection_timeout(timeout);
    cli->set_read_timeout(timeout);
    cli->set_write_timeout(timeout);
    cli->set_keep_alive(false);
    return cli;
}

}  // namespace hazard
