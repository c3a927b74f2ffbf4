#include "coroform/core/response.hpp"

#include "coroform/core/error.hpp"
#include "coroform/core/request.hpp"

#include <sstream>

namespace coroform {

std::optional<std::string_view> Response::header(std::string_view key) const {
    HeaderKeyEqual eq;
    for (const auto& [k, v] : headers_) {
        if (eq(k, key)) return std::string_view(v);
    }
    return std::nullopt;
}

std::vector<std::string_view> Response::header_values(std::string_view key) const {
    HeaderKeyEqual eq;
    std::vector<std::string_view> values;
    for (const auto& [k, v] : headers_) {
        if (eq(k, key)) values.emplace_back(v);
    }
    return values;
}

void Response::set_header(std::string key, std::string value) {
    HeaderKeyEqual eq;
    for (auto& [k, v] : headers_) {
        if (eq(k, key)) {
            v = std::move(value);
            return;
        }
    }
    headers_.emplace_back(std::move(key), std::move(value));
}

std::string Response::serialize() const {
    std::ostringstream oss;

    oss << "HTTP/1.1 " << status_ << " " << status_text_ << "\r\n";
    for (const auto& [key, value] : headers_) {
        oss << key << ": " << value << "\r\n";
    }
    oss << "\r\n";
    oss << body_;

    return oss.str();
}

Response Response::text(int status, std::string body, std::string content_type) {
    Response r;
    r.set_status(status);
    r.body_ = std::move(body);
    if (!r.body_.empty()) {
        r.headers_.emplace_back("Content-Type", std::move(content_type));
    }
    r.headers_.emplace_back("Content-Length", std::to_string(r.body_.size()));
    return r;
}

std::string_view Response::default_status_text(int status) noexcept {
    switch (status) {
        // 2xx Success
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";

        // 3xx Redirection
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 307: return "Temporary Redirect";

        // 4xx Client Errors
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 422: return "Unprocessable Entity";

        // 5xx Server Errors
        case 500: return "Internal Server Error";

        default: return "Unknown";
    }
}

Response error_response(const Error& error) {
    int status = error.http_status();
    std::string body(error.message());
    if (body.empty()) {
        body = std::string(Response(status, {}, {}).status_text());
    }
    return Response::text(status, std::move(body));
}

} // namespace coroform
