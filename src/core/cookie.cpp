#include "coroform/core/cookie.hpp"

#include <cctype>
#include <sstream>

namespace coroform {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

} // anonymous namespace

// ============================================================================
// Cookie Implementation
// ============================================================================

std::string Cookie::to_header() const {
    std::ostringstream oss;
    oss << name << "=" << value;

    if (domain) oss << "; Domain=" << *domain;
    if (path) oss << "; Path=" << *path;
    if (max_age) oss << "; Max-Age=" << max_age->count();
    if (secure) oss << "; Secure";
    if (http_only) oss << "; HttpOnly";

    switch (same_site) {
        case SameSite::None: oss << "; SameSite=None"; break;
        case SameSite::Lax: oss << "; SameSite=Lax"; break;
        case SameSite::Strict: oss << "; SameSite=Strict"; break;
    }
    return oss.str();
}

Cookie Cookie::expired(std::string name) {
    Cookie c;
    c.name = std::move(name);
    c.max_age = std::chrono::seconds(0);
    return c;
}

// ============================================================================
// CookieJar Implementation
// ============================================================================

CookieJar CookieJar::parse(std::string_view header) {
    CookieJar jar;

    size_t start = 0;
    while (start < header.size()) {
        size_t end = header.find(';', start);
        if (end == std::string_view::npos) {
            end = header.size();
        }

        auto pair = trim(header.substr(start, end - start));
        auto eq = pair.find('=');
        if (eq != std::string_view::npos) {
            auto name = trim(pair.substr(0, eq));
            auto value = trim(pair.substr(eq + 1));

            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            if (!name.empty()) {
                jar.cookies_[std::string(name)] = std::string(value);
            }
        }
        start = end + 1;
    }
    return jar;
}

CookieJar CookieJar::from_request(const Request& req) {
    auto cookie_header = req.header("Cookie");
    if (!cookie_header) {
        return CookieJar{};
    }
    return parse(*cookie_header);
}

std::optional<std::string_view> CookieJar::get(std::string_view name) const {
    auto it = cookies_.find(std::string(name));
    if (it == cookies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CookieJar::has(std::string_view name) const {
    return cookies_.count(std::string(name)) > 0;
}

void CookieJar::set(std::string name, std::string value) {
    cookies_[std::move(name)] = std::move(value);
}

void CookieJar::remove(std::string_view name) {
    cookies_.erase(std::string(name));
}

std::string CookieJar::to_header() const {
    std::string out;
    for (const auto& [name, value] : cookies_) {
        if (!out.empty()) out += "; ";
        out += name;
        out += '=';
        out += value;
    }
    return out;
}

// ============================================================================
// Response Helpers
// ============================================================================

void set_cookie(Response& resp, const Cookie& cookie) {
    resp.add_header("Set-Cookie", cookie.to_header());
}

void delete_cookie(Response& resp, std::string_view name,
                   std::string_view path,
                   std::string_view domain) {
    Cookie c = Cookie::expired(std::string(name));
    if (!path.empty()) {
        c.path = std::string(path);
    }
    if (!domain.empty()) {
        c.domain = std::string(domain);
    }
    set_cookie(resp, c);
}

} // namespace coroform
