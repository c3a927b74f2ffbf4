#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace coroform {

// ============================================================================
// HTTP Errors (protocol layer)
// ============================================================================

enum class HttpError {
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    PayloadTooLarge = 413,
    UnsupportedMediaType = 415,
    Internal = 500
};

// ============================================================================
// CSRF Errors (request rejected by the CSRF protocol)
// ============================================================================

enum class CsrfError {
    TokenMissing = 1,
    TokenExpired,
    TokenInvalid,
    SessionMissing,
    TokenMismatch,
    ReferrerMissing,
    ReferrerMismatch
};

} // namespace coroform

template<>
struct std::is_error_code_enum<coroform::HttpError> : std::true_type {};

template<>
struct std::is_error_code_enum<coroform::CsrfError> : std::true_type {};

namespace coroform {

const std::error_category& http_error_category() noexcept;
std::error_code make_error_code(HttpError e) noexcept;

// Messages of this category are the exact texts sent back to clients
const std::error_category& csrf_error_category() noexcept;
std::error_code make_error_code(CsrfError e) noexcept;

// ============================================================================
// Unified Error Type
// ============================================================================

class Error {
public:
    using Variant = std::variant<HttpError, CsrfError, std::error_code>;

private:
    Variant inner_;
    std::string message_;

public:
    Error(HttpError e, std::string message = "")
        : inner_(e), message_(std::move(message)) {}

    Error(CsrfError e, std::string message = "")
        : inner_(e), message_(std::move(message)) {}

    Error(std::error_code ec, std::string message = "")
        : inner_(ec), message_(std::move(message)) {}

    static Error http(HttpError e, std::string msg = "") {
        return Error(e, std::move(msg));
    }

    static Error http(int status, std::string msg = "") {
        return Error(static_cast<HttpError>(status), std::move(msg));
    }

    // The message defaults to the category text, e.g. "The CSRF token is missing."
    static Error csrf(CsrfError e) {
        return Error(e, make_error_code(e).message());
    }

    static Error system(std::error_code ec) {
        return Error(ec, ec.message());
    }

    bool is_http() const noexcept {
        return std::holds_alternative<HttpError>(inner_);
    }

    bool is_csrf() const noexcept {
        return std::holds_alternative<CsrfError>(inner_);
    }

    bool is_system() const noexcept {
        return std::holds_alternative<std::error_code>(inner_);
    }

    HttpError http_error() const noexcept {
        return is_http() ? std::get<HttpError>(inner_) : HttpError::Internal;
    }

    CsrfError csrf_error() const noexcept {
        return is_csrf() ? std::get<CsrfError>(inner_) : CsrfError::TokenInvalid;
    }

    std::error_code system_error() const noexcept {
        return is_system() ? std::get<std::error_code>(inner_) : std::error_code{};
    }

    std::error_code code() const noexcept;

    // CSRF failures are always 403, non-HTTP system errors 500
    int http_status() const noexcept {
        if (is_http()) {
            return static_cast<int>(std::get<HttpError>(inner_));
        }
        if (is_csrf()) {
            return 403;
        }
        return 500;
    }

    std::string_view message() const noexcept {
        return message_;
    }

    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return inner_ == other.inner_;
    }

    bool operator!=(const Error& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace coroform
