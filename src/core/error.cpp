#include "coroform/core/error.hpp"

#include <sstream>

namespace coroform {

// ============================================================================
// Error Categories
// ============================================================================

namespace {

class HttpErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "coroform.http";
    }

    std::string message(int ev) const override {
        switch (static_cast<HttpError>(ev)) {
            case HttpError::BadRequest: return "Bad Request";
            case HttpError::Unauthorized: return "Unauthorized";
            case HttpError::Forbidden: return "Forbidden";
            case HttpError::NotFound: return "Not Found";
            case HttpError::MethodNotAllowed: return "Method Not Allowed";
            case HttpError::PayloadTooLarge: return "Payload Too Large";
            case HttpError::UnsupportedMediaType: return "Unsupported Media Type";
            case HttpError::Internal: return "Internal Server Error";
            default: return "Unknown HTTP error";
        }
    }
};

class CsrfErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "coroform.csrf";
    }

    std::string message(int ev) const override {
        switch (static_cast<CsrfError>(ev)) {
            case CsrfError::TokenMissing: return "The CSRF token is missing.";
            case CsrfError::TokenExpired: return "The CSRF token has expired.";
            case CsrfError::TokenInvalid: return "The CSRF token is invalid.";
            case CsrfError::SessionMissing: return "The CSRF session token is missing.";
            case CsrfError::TokenMismatch: return "The CSRF tokens do not match.";
            case CsrfError::ReferrerMissing: return "The referrer header is missing.";
            case CsrfError::ReferrerMismatch: return "The referrer does not match the host.";
            default: return "Unknown CSRF error";
        }
    }
};

const HttpErrorCategory http_category_instance{};
const CsrfErrorCategory csrf_category_instance{};

} // anonymous namespace

const std::error_category& http_error_category() noexcept {
    return http_category_instance;
}

std::error_code make_error_code(HttpError e) noexcept {
    return {static_cast<int>(e), http_error_category()};
}

const std::error_category& csrf_error_category() noexcept {
    return csrf_category_instance;
}

std::error_code make_error_code(CsrfError e) noexcept {
    return {static_cast<int>(e), csrf_error_category()};
}

// ============================================================================
// Error Implementation
// ============================================================================

std::error_code Error::code() const noexcept {
    if (is_http()) {
        return make_error_code(std::get<HttpError>(inner_));
    }
    if (is_csrf()) {
        return make_error_code(std::get<CsrfError>(inner_));
    }
    return std::get<std::error_code>(inner_);
}

std::string Error::to_string() const {
    std::ostringstream oss;

    if (is_http()) {
        auto e = std::get<HttpError>(inner_);
        oss << "HttpError::" << static_cast<int>(e) << " "
            << http_error_category().message(static_cast<int>(e));
    } else if (is_csrf()) {
        oss << "CsrfError::" << static_cast<int>(std::get<CsrfError>(inner_));
    } else {
        auto ec = std::get<std::error_code>(inner_);
        oss << "SystemError::" << ec.category().name() << ":" << ec.value();
    }

    if (!message_.empty()) {
        oss << " - " << message_;
    }

    return oss.str();
}

} // namespace coroform
