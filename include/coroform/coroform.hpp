#pragma once

// Main include file for coroform

// Utilities
#include "coroform/util/expected.hpp"
#include "coroform/util/from_string.hpp"

// Core
#include "coroform/core/app.hpp"
#include "coroform/core/cookie.hpp"
#include "coroform/core/error.hpp"
#include "coroform/core/form_data.hpp"
#include "coroform/core/logging.hpp"
#include "coroform/core/request.hpp"
#include "coroform/core/response.hpp"
#include "coroform/core/session.hpp"
#include "coroform/core/test_client.hpp"
#include "coroform/core/url.hpp"

// Coroutines
#include "coroform/coro/cancellation.hpp"
#include "coroform/coro/task.hpp"
#include "coroform/coro/when_all.hpp"

// CSRF
#include "coroform/csrf/config.hpp"
#include "coroform/csrf/origin.hpp"
#include "coroform/csrf/protect.hpp"
#include "coroform/csrf/secret.hpp"
#include "coroform/csrf/signer.hpp"
#include "coroform/csrf/token.hpp"

// Forms
#include "coroform/form/field.hpp"
#include "coroform/form/form.hpp"
#include "coroform/form/validators.hpp"
