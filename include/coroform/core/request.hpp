#pragma once

#include <any>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>

#include "coroform/core/error.hpp"
#include "coroform/core/url.hpp"
#include "coroform/util/expected.hpp"
#include "coroform/util/from_string.hpp"

namespace coroform {

// ============================================================================
// HTTP Method
// ============================================================================

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    PATCH,
    HEAD,
    OPTIONS,
    CONNECT,
    TRACE,
    UNKNOWN
};

HttpMethod parse_method(std::string_view method) noexcept;
std::string_view method_to_string(HttpMethod method) noexcept;

// POST, PUT, PATCH and DELETE carry a submission
bool is_submit_method(HttpMethod method) noexcept;

// ============================================================================
// Case-insensitive header keys
// ============================================================================

struct HeaderKeyHash {
    size_t operator()(std::string_view key) const noexcept;
};

struct HeaderKeyEqual {
    bool operator()(std::string_view a, std::string_view b) const noexcept;
};

// ============================================================================
// Request
// ============================================================================

class Request {
public:
    using Headers = std::unordered_map<std::string, std::string, HeaderKeyHash, HeaderKeyEqual>;
    using QueryParams = std::unordered_map<std::string, std::string>;

private:
    HttpMethod method_ = HttpMethod::GET;
    std::string scheme_ = "http";
    std::string path_ = "/";
    std::string query_string_;
    Headers headers_;
    QueryParams query_params_;
    std::string body_;

    // Request context (for middleware to store data)
    mutable std::unordered_map<std::string, std::any> context_;

    // Typed per-request state, one slot per type
    std::unordered_map<std::type_index, std::any> state_;

public:
    Request() = default;

    Request(const Request&) = delete;
    Request& operator=(const Request&) = delete;
    Request(Request&&) = default;
    Request& operator=(Request&&) = default;

    // Accessors
    HttpMethod method() const noexcept { return method_; }
    std::string_view scheme() const noexcept { return scheme_; }
    std::string_view path() const noexcept { return path_; }
    std::string_view query_string() const noexcept { return query_string_; }
    const Headers& headers() const noexcept { return headers_; }
    std::string_view body() const noexcept { return body_; }

    // Setters (for parser)
    void set_method(HttpMethod m) { method_ = m; }
    void set_method(std::string_view m) { method_ = parse_method(m); }
    void set_scheme(std::string s) { scheme_ = std::move(s); }
    void set_path(std::string p) { path_ = std::move(p); }
    void set_query_string(std::string qs);
    void set_body(std::string b) { body_ = std::move(b); }

    void add_header(std::string key, std::string value) {
        headers_[std::move(key)] = std::move(value);
    }

    void remove_header(std::string_view key) {
        headers_.erase(std::string(key));
    }

    const QueryParams& query_params() const noexcept { return query_params_; }

    // Case-insensitive
    std::optional<std::string_view> header(std::string_view key) const {
        auto it = headers_.find(std::string(key));
        if (it != headers_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    template<typename T = std::string>
    expected<T, Error> query(std::string_view key) const {
        auto it = query_params_.find(std::string(key));
        if (it == query_params_.end()) {
            return unexpected(Error::http(HttpError::BadRequest,
                                          "Missing query parameter: " + std::string(key)));
        }
        return from_string<T>(it->second);
    }

    std::optional<size_t> content_length() const {
        auto cl = header("Content-Length");
        if (cl) {
            auto result = from_string<size_t>(*cl);
            if (result) return *result;
        }
        return std::nullopt;
    }

    std::optional<std::string_view> content_type() const {
        return header("Content-Type");
    }

    // Media type of Content-Type, lower-cased and without parameters
    std::string media_type() const;

    // The URL the client addressed, built from the scheme and the Host header.
    // Returns nullopt without a usable Host header.
    std::optional<Url> url() const;

    // ------------------------------------------------------------------
    // Context storage (for middleware)
    // ------------------------------------------------------------------

    template<typename T>
    void set_context(const std::string& key, T value) const {
        context_[key] = std::move(value);
    }

    template<typename T>
    std::optional<T> get_context(const std::string& key) const {
        auto it = context_.find(key);
        if (it == context_.end()) return std::nullopt;
        if (auto* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

    bool has_context(const std::string& key) const {
        return context_.count(key) > 0;
    }

    // ------------------------------------------------------------------
    // Typed state
    // ------------------------------------------------------------------

    // Returns the T attached to this request, default-constructing it on
    // first access
    template<typename T>
    T& state() {
        auto& slot = state_[std::type_index(typeid(T))];
        if (!slot.has_value()) {
            slot.template emplace<T>();
        }
        return *std::any_cast<T>(&slot);
    }

    template<typename T>
    T* find_state() noexcept {
        auto it = state_.find(std::type_index(typeid(T)));
        if (it == state_.end()) return nullptr;
        return std::any_cast<T>(&it->second);
    }

    template<typename T>
    const T* find_state() const noexcept {
        auto it = state_.find(std::type_index(typeid(T)));
        if (it == state_.end()) return nullptr;
        return std::any_cast<T>(&it->second);
    }

    template<typename T>
    void clear_state() {
        state_.erase(std::type_index(typeid(T)));
    }
};

// Decode %XX escapes and '+' as used in query strings and urlencoded bodies.
// Invalid escapes are kept as written.
std::string url_decode(std::string_view s);

std::string url_encode(std::string_view s);

} // namespace coroform
