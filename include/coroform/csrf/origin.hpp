#pragma once

#include <optional>
#include <string>

#include "coroform/core/error.hpp"
#include "coroform/core/request.hpp"
#include "coroform/core/url.hpp"
#include "coroform/coro/task.hpp"
#include "coroform/csrf/config.hpp"
#include "coroform/util/expected.hpp"

namespace coroform {

// Same scheme, same hostname (case-insensitive) and same port. Ports are
// compared as written: an absent port differs from an explicit default one.
bool same_origin(const Url& a, const Url& b) noexcept;

// Checks the Referer of a secure request against the request URL
expected<void, Error> check_referrer(const Request& req);

// Token submitted with the request: the form or JSON field named by the
// config first, then the configured headers in order. Empty values are
// skipped. Fails only when the body cannot be parsed.
Task<expected<std::optional<std::string>, Error>> extract_token(Request& req, const CsrfConfig& config);

} // namespace coroform
