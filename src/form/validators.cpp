#include "coroform/form/validators.hpp"

#include <cctype>
#include <stdexcept>

#include "coroform/form/form.hpp"

namespace coroform {

namespace {

bool is_blank(std::string_view s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

std::string plural(int n, std::string_view singular, std::string_view many) {
    return std::string(n == 1 ? singular : many);
}

std::string length_message(int min, int max) {
    if (max == -1) {
        return "Field must be at least " + std::to_string(min) + " " +
               plural(min, "character", "characters") + " long.";
    }
    if (min == -1) {
        return "Field cannot be longer than " + std::to_string(max) + " " +
               plural(max, "character", "characters") + ".";
    }
    if (min == max) {
        return "Field must be exactly " + std::to_string(max) + " " +
               plural(max, "character", "characters") + " long.";
    }
    return "Field must be between " + std::to_string(min) + " and " +
           std::to_string(max) + " characters long.";
}

bool valid_domain_label(std::string_view label) {
    if (label.empty() || label.size() > 63) return false;
    if (label.front() == '-' || label.back() == '-') return false;
    for (unsigned char c : label) {
        if (!std::isalnum(c) && c != '-' && c < 0x80) return false;
    }
    return true;
}

bool looks_like_email(std::string_view address) {
    auto at = address.rfind('@');
    if (at == std::string_view::npos || at == 0 || at + 1 == address.size()) {
        return false;
    }

    auto local = address.substr(0, at);
    auto domain = address.substr(at + 1);

    for (unsigned char c : local) {
        if (std::isspace(c) || c == '@' || c == '<' || c == '>' || c == ',' || c == ';') {
            return false;
        }
    }
    if (local.front() == '.' || local.back() == '.' || local.find("..") != std::string_view::npos) {
        return false;
    }

    if (domain.find('.') == std::string_view::npos) {
        return false;
    }
    while (!domain.empty()) {
        auto dot = domain.find('.');
        if (!valid_domain_label(domain.substr(0, dot))) return false;
        if (dot == std::string_view::npos) break;
        domain.remove_prefix(dot + 1);
        if (domain.empty()) return false;
    }
    return true;
}

} // anonymous namespace

Validator data_required(std::string message) {
    if (message.empty()) message = "This field is required.";
    return [message = std::move(message)](Form&, Field& field) -> ValidationResult {
        if (field.has_data()) return std::nullopt;
        return ValidationFailure::stop_chain(message);
    };
}

Validator input_required(std::string message) {
    if (message.empty()) message = "This field is required.";
    return [message = std::move(message)](Form&, Field& field) -> ValidationResult {
        const auto& raw = field.raw_data();
        if (raw && !raw->empty() && !raw->front().empty()) return std::nullopt;
        return ValidationFailure::stop_chain(message);
    };
}

Validator optional() {
    return [](Form&, Field& field) -> ValidationResult {
        const auto& raw = field.raw_data();
        if (!raw || raw->empty() || is_blank(raw->front())) {
            return ValidationFailure::stop_chain();
        }
        return std::nullopt;
    };
}

Validator length(int min, int max, std::string message) {
    if (min == -1 && max == -1) {
        throw std::invalid_argument("length() needs at least one bound");
    }
    if (max != -1 && min > max) {
        throw std::invalid_argument("length() minimum exceeds maximum");
    }
    if (message.empty()) message = length_message(min, max);

    return [min, max, message = std::move(message)](Form&, Field& field) -> ValidationResult {
        auto text = field.text();
        auto size = static_cast<int>(text ? text->size() : 0);
        if (size < min || (max != -1 && size > max)) {
            return ValidationFailure::error(message);
        }
        return std::nullopt;
    };
}

Validator equal_to(std::string other, std::string message) {
    return [other = std::move(other), message = std::move(message)](Form& form, Field& field) -> ValidationResult {
        Field* target = form.field(other);
        if (!target) {
            return ValidationFailure::error("Invalid field name '" + other + "'.");
        }
        if (field.text() == target->text()) {
            return std::nullopt;
        }
        if (!message.empty()) {
            return ValidationFailure::error(message);
        }
        return ValidationFailure::error("Field must be equal to " + target->label() + ".");
    };
}

Validator email(std::string message) {
    if (message.empty()) message = "Invalid email address.";
    return [message = std::move(message)](Form&, Field& field) -> ValidationResult {
        auto text = field.text();
        if (text && looks_like_email(*text)) return std::nullopt;
        return ValidationFailure::error(message);
    };
}

} // namespace coroform
