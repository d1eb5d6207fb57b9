#pragma once

#include <memory>
#include <string>

#include <httplib.h>

namespace hazard {

struct UrlParts {
    std::string origin;   // scheme://host[:port]
    std::string path;     // begins with '/', no trailing '/'
};

// "http://host:8000/api/" -> {"http://host:8000", "/api"}
UrlParts split_url(const std::string& url);

std::unique_ptr<httplib::Client> make_client(const std::string& origin, int timeout_ms);

std::string join_path(const std::string& base, const std::string& tail);

}  // namespace hazard
