#pragma once

#include <charconv>
#include <string>
#include <string_view>
#include <type_traits>

#include "coroform/util/expected.hpp"
#include "coroform/core/error.hpp"

namespace coroform {

// ============================================================================
// FromString trait - Convert submitted text to type T
// ============================================================================

template<typename T, typename = void>
struct FromString;

template<typename T>
struct FromString<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    static expected<T, Error> parse(std::string_view s) {
        if (s.empty()) {
            return unexpected(Error::http(HttpError::BadRequest, "Empty value"));
        }

        // from_chars rejects a leading '+', text inputs commonly carry one
        if (s.front() == '+' && s.size() > 1) {
            s.remove_prefix(1);
        }

        T value;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

        if (ec == std::errc{} && ptr == s.data() + s.size()) {
            return value;
        }

        if (ec == std::errc::result_out_of_range) {
            return unexpected(Error::http(HttpError::BadRequest,
                "Value out of range: " + std::string(s)));
        }

        return unexpected(Error::http(HttpError::BadRequest,
            "Invalid integer: " + std::string(s)));
    }
};

template<>
struct FromString<bool> {
    static expected<bool, Error> parse(std::string_view s) {
        if (s == "true" || s == "1" || s == "yes" || s == "on") {
            return true;
        }
        if (s == "false" || s == "0" || s == "no" || s == "off") {
            return false;
        }
        return unexpected(Error::http(HttpError::BadRequest,
            "Invalid boolean: " + std::string(s)));
    }
};

template<>
struct FromString<std::string> {
    static expected<std::string, Error> parse(std::string_view s) {
        return std::string(s);
    }
};

template<typename T>
expected<T, Error> from_string(std::string_view s) {
    return FromString<T>::parse(s);
}

} // namespace coroform
