#pragma once

#include <memory>
#include <string>

#include "coroform/core/app.hpp"
#include "coroform/core/request.hpp"
#include "coroform/core/response.hpp"
#include "coroform/coro/task.hpp"
#include "coroform/csrf/config.hpp"

namespace coroform {

// ============================================================================
// CsrfProtect - attaches the CSRF config to every request
// ============================================================================

class CsrfProtect {
    std::shared_ptr<const CsrfConfig> config_;

public:
    // Throws std::invalid_argument on an invalid config
    explicit CsrfProtect(CsrfConfig config);

    Task<Response> operator()(Request& req, Next next) const;

    const CsrfConfig& config() const noexcept { return *config_; }
};

// Must run after the session middleware
Middleware csrf_protect_middleware(CsrfConfig config);

// ============================================================================
// Gate
// ============================================================================

// Validates the CSRF token of submissions (POST, PUT, PATCH, DELETE) before
// calling the handler. Rejected requests get a 403 whose body is the reason.
// Throws std::logic_error when the CSRF or session middleware did not run.
Handler csrf_protect(Handler handler);

// Signed token for templates and API responses. Empty when protection is
// disabled. Throws std::logic_error when the CSRF or session middleware did
// not run.
std::string csrf_token(Request& req);

// The config attached by the middleware, nullptr if it did not run
std::shared_ptr<const CsrfConfig> csrf_config(const Request& req);

} // namespace coroform
