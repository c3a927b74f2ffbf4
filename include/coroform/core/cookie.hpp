#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "coroform/core/request.hpp"
#include "coroform/core/response.hpp"

namespace coroform {

// ============================================================================
// Cookie SameSite Policy
// ============================================================================

enum class SameSite {
    None,
    Lax,
    Strict
};

// ============================================================================
// Cookie (for setting)
// ============================================================================

struct Cookie {
    std::string name;
    std::string value;

    std::optional<std::string> domain = std::nullopt;
    std::optional<std::string> path = std::nullopt;
    std::optional<std::chrono::seconds> max_age = std::nullopt;
    bool secure = false;
    bool http_only = false;
    SameSite same_site = SameSite::Lax;

    // Serialize to Set-Cookie header value
    std::string to_header() const;

    // Create a cookie that expires immediately (for deletion)
    static Cookie expired(std::string name);
};

// ============================================================================
// Cookie Jar (parsed cookies from request)
// ============================================================================

class CookieJar {
    std::unordered_map<std::string, std::string> cookies_;

public:
    CookieJar() = default;

    // Parse from Cookie header value
    static CookieJar parse(std::string_view header);

    static CookieJar from_request(const Request& req);

    std::optional<std::string_view> get(std::string_view name) const;

    bool has(std::string_view name) const;

    const std::unordered_map<std::string, std::string>& all() const { return cookies_; }

    size_t size() const { return cookies_.size(); }
    bool empty() const { return cookies_.empty(); }

    void set(std::string name, std::string value);
    void remove(std::string_view name);

    // Serialize back to a Cookie request header value
    std::string to_header() const;
};

// ============================================================================
// Response Cookie Helpers
// ============================================================================

void set_cookie(Response& resp, const Cookie& cookie);

void delete_cookie(Response& resp, std::string_view name,
                   std::string_view path = "/",
                   std::string_view domain = "");

inline CookieJar cookies(const Request& req) {
    return CookieJar::from_request(req);
}

} // namespace coroform
