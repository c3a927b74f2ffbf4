#include "coroform/csrf/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "coroform/util/from_string.hpp"

namespace coroform {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool parse_flag(const char* name, std::string_view value) {
    auto v = lower(trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument(std::string(name) + ": expected a boolean, got '" + std::string(value) + "'");
}

} // anonymous namespace

void CsrfConfig::validate() const {
    if (enabled && secret.empty()) {
        throw std::invalid_argument("CSRF protection is enabled but no secret is configured");
    }
    if (enabled && field_name.empty()) {
        throw std::invalid_argument("CSRF field name must not be empty");
    }
}

CsrfConfig CsrfConfig::from_env() {
    CsrfConfig config;

    if (const char* enabled = std::getenv("COROFORM_CSRF_ENABLED")) {
        config.enabled = parse_flag("COROFORM_CSRF_ENABLED", enabled);
    }
    if (const char* secret = std::getenv("COROFORM_CSRF_SECRET")) {
        config.secret = Secret(secret);
    }
    if (const char* field = std::getenv("COROFORM_CSRF_FIELD_NAME")) {
        config.field_name = std::string(trim(field));
    }

    if (const char* limit = std::getenv("COROFORM_CSRF_TIME_LIMIT")) {
        auto value = trim(limit);
        if (lower(value) == "none" || value.empty()) {
            config.time_limit = std::nullopt;
        } else {
            auto seconds = from_string<int64_t>(value);
            if (!seconds || *seconds < 0) {
                throw std::invalid_argument("COROFORM_CSRF_TIME_LIMIT: expected seconds or 'none', got '" +
                                            std::string(value) + "'");
            }
            config.time_limit = std::chrono::seconds(*seconds);
        }
    }

    if (const char* headers = std::getenv("COROFORM_CSRF_HEADERS")) {
        config.headers.clear();
        std::string_view rest = headers;
        while (!rest.empty()) {
            auto comma = rest.find(',');
            auto name = trim(rest.substr(0, comma));
            rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);
            if (!name.empty()) {
                config.headers.emplace_back(name);
            }
        }
    }

    if (const char* strict = std::getenv("COROFORM_CSRF_SSL_STRICT")) {
        config.ssl_strict = parse_flag("COROFORM_CSRF_SSL_STRICT", strict);
    }

    return config;
}

} // namespace coroform
