#include "coroform/csrf/origin.hpp"

#include "coroform/core/form_data.hpp"

namespace coroform {

bool same_origin(const Url& a, const Url& b) noexcept {
    return a.scheme == b.scheme &&
           HeaderKeyEqual{}(a.host, b.host) &&
           a.port == b.port;
}

expected<void, Error> check_referrer(const Request& req) {
    auto referrer = req.header("Referer");
    if (!referrer || referrer->empty()) {
        return unexpected(Error::csrf(CsrfError::ReferrerMissing));
    }

    auto referrer_url = parse_url(*referrer);
    auto request_url = req.url();
    if (!referrer_url || !request_url || !same_origin(*referrer_url, *request_url)) {
        return unexpected(Error::csrf(CsrfError::ReferrerMismatch));
    }
    return {};
}

Task<expected<std::optional<std::string>, Error>> extract_token(Request& req, const CsrfConfig& config) {
    auto formdata = co_await read_formdata(req);
    if (!formdata) {
        co_return unexpected(formdata.error());
    }

    if (auto value = formdata->get(config.field_name); value && !value->empty()) {
        co_return std::optional<std::string>(std::string(*value));
    }

    for (const auto& name : config.headers) {
        if (auto value = req.header(name); value && !value->empty()) {
            co_return std::optional<std::string>(std::string(*value));
        }
    }

    co_return std::optional<std::string>{};
}

} // namespace coroform
