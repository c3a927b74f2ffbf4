#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "coroform/csrf/secret.hpp"

namespace coroform {

// ============================================================================
// CsrfConfig
// ============================================================================

struct CsrfConfig {
    bool enabled = true;

    // Required when enabled
    Secret secret;

    // Session key and form field name of the token
    std::string field_name = "csrf_token";

    // nullopt disables expiry
    std::optional<std::chrono::seconds> time_limit = std::chrono::seconds(3600);

    // Searched in order when the submission carries no token
    std::vector<std::string> headers = {"X-CSRFToken", "X-CSRF-Token"};

    // On https, require a same-origin Referer
    bool ssl_strict = true;

    // Throws std::invalid_argument when enabled without a secret
    void validate() const;

    // COROFORM_CSRF_ENABLED, COROFORM_CSRF_SECRET, COROFORM_CSRF_FIELD_NAME,
    // COROFORM_CSRF_TIME_LIMIT (seconds or "none"), COROFORM_CSRF_HEADERS
    // (comma separated) and COROFORM_CSRF_SSL_STRICT over the defaults.
    // Throws std::invalid_argument on unparsable values.
    static CsrfConfig from_env();
};

// ============================================================================
// CsrfState - per-request CSRF context
// ============================================================================

struct CsrfState {
    // Attached by the CSRF middleware, shared by every request
    std::shared_ptr<const CsrfConfig> config;

    // Signed token issued during this request, per field name
    std::unordered_map<std::string, std::string> signed_tokens;

    // Set by the gate once the request passed validation
    bool validated = false;
};

} // namespace coroform
