#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "coroform/csrf/secret.hpp"
#include "coroform/util/expected.hpp"

namespace coroform {

// ============================================================================
// Signature failures
// ============================================================================

enum class SignatureError {
    Invalid,    // bad signature or malformed token
    Expired     // signature valid but older than the allowed age
};

std::string_view signature_error_name(SignatureError e) noexcept;

// Seconds since the Unix epoch
using Clock = std::function<int64_t()>;

int64_t system_clock_seconds();

// ============================================================================
// Encoding helpers
// ============================================================================

namespace signing {

// URL-safe alphabet, no padding
std::string base64_encode(std::string_view data);

// Accepts input with or without padding; nullopt on characters outside the
// URL-safe alphabet
std::optional<std::string> base64_decode(std::string_view data);

std::string hex_encode(std::string_view data);

// SHA1(salt + "signer" + secret)
std::string derive_key(std::string_view secret, std::string_view salt);

// Constant-time equality
bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

} // namespace signing

// ============================================================================
// TimestampSigner
// ============================================================================

// Produces "value.timestamp.signature" with an HMAC-SHA1 signature over
// "value.timestamp". The timestamp is the big-endian integer with leading
// zero bytes removed, base64 encoded.
class TimestampSigner {
    std::string key_;
    Clock clock_;

public:
    TimestampSigner(const Secret& secret, std::string_view salt, Clock clock = {});

    std::string sign(std::string_view value) const;

    // Returns the value when the signature matches and, if max_age is set,
    // the timestamp is not older than max_age seconds nor in the future
    expected<std::string, SignatureError> unsign(std::string_view signed_value,
                                                 std::optional<int64_t> max_age = std::nullopt) const;

    int64_t now() const;

private:
    std::string signature(std::string_view value) const;
};

// ============================================================================
// UrlSafeTimedSerializer
// ============================================================================

// Signs string values as compact JSON, zlib-compressed (prefixed with '.')
// when that is shorter, in the URL-safe token format of itsdangerous.
class UrlSafeTimedSerializer {
    TimestampSigner signer_;

public:
    UrlSafeTimedSerializer(const Secret& secret, std::string_view salt, Clock clock = {})
        : signer_(secret, salt, std::move(clock)) {}

    std::string dumps(std::string_view value) const;

    // Invalid also covers payloads that do not decode to a JSON string
    expected<std::string, SignatureError> loads(std::string_view token,
                                                std::optional<int64_t> max_age = std::nullopt) const;
};

} // namespace coroform
