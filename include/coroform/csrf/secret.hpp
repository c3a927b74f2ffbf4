#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace coroform {

// ============================================================================
// Secret - signing key that does not leak into logs
// ============================================================================

class Secret {
    std::string value_;

public:
    Secret() = default;
    Secret(std::string value) : value_(std::move(value)) {}
    Secret(std::string_view value) : value_(value) {}
    Secret(const char* value) : value_(value ? value : "") {}

    // Raw key material
    const std::string& str() const noexcept { return value_; }

    bool empty() const noexcept { return value_.empty(); }

    explicit operator bool() const noexcept { return !value_.empty(); }

    friend std::ostream& operator<<(std::ostream& os, const Secret&) {
        return os << "Secret('**********')";
    }
};

} // namespace coroform
