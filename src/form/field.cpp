#include "coroform/form/field.hpp"

#include <cctype>
#include <stdexcept>

#include "coroform/core/session.hpp"
#include "coroform/csrf/protect.hpp"
#include "coroform/csrf/token.hpp"
#include "coroform/util/from_string.hpp"

namespace coroform {

std::string default_label(std::string_view name) {
    std::string label;
    label.reserve(name.size());
    bool word_start = true;
    for (char c : name) {
        if (c == '_') {
            label += ' ';
            word_start = true;
        } else if (word_start) {
            label += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            word_start = false;
        } else {
            label += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return label;
}

// ============================================================================
// Field
// ============================================================================

Field::Field(std::string name, std::vector<Validator> validators, std::string label)
    : name_(std::move(name))
    , input_name_(name_)
    , label_(label.empty() ? default_label(name_) : std::move(label))
    , validators_(std::move(validators))
{}

void Field::bind(std::string_view prefix) {
    input_name_ = std::string(prefix) + name_;
}

void Field::process(const FormData* formdata) {
    process_errors_.clear();
    errors_.clear();
    reset_to_default();

    if (!formdata) {
        raw_data_.reset();
        return;
    }

    auto values = formdata->get_fields(input_name_);
    raw_data_.emplace();
    raw_data_->reserve(values.size());
    for (const auto* value : values) {
        raw_data_->push_back(value->value);
    }

    if (auto error = process_formdata(values)) {
        process_errors_.push_back(std::move(*error));
    }
}

bool Field::validate(Form& form, const std::vector<Validator>& extra) {
    errors_ = process_errors_;

    auto run = [&](const Validator& validator) {
        auto failure = validator(form, *this);
        if (!failure) return false;
        if (!failure->message.empty()) {
            errors_.push_back(std::move(failure->message));
        }
        return failure->stop;
    };

    bool stopped = false;
    if (auto failure = pre_validate(form)) {
        if (!failure->message.empty()) {
            errors_.push_back(std::move(failure->message));
        }
        stopped = failure->stop;
    }

    for (const auto& validator : validators_) {
        if (stopped) break;
        stopped = run(validator);
    }
    for (const auto& validator : extra) {
        if (stopped) break;
        stopped = run(validator);
    }

    return errors_.empty();
}

std::string Field::render_value() const {
    return text().value_or("");
}

// ============================================================================
// StringField
// ============================================================================

StringField::StringField(std::string name,
                         std::vector<Validator> validators,
                         std::optional<std::string> default_value,
                         std::string label)
    : Field(std::move(name), std::move(validators), std::move(label))
    , default_(std::move(default_value))
    , data_(default_)
{}

bool StringField::has_data() const {
    if (!data_) return false;
    for (unsigned char c : *data_) {
        if (!std::isspace(c)) return true;
    }
    return false;
}

std::optional<std::string> StringField::process_formdata(const std::vector<const FormField*>& values) {
    if (!values.empty()) {
        data_ = values.front()->value;
    }
    return std::nullopt;
}

// ============================================================================
// IntegerField
// ============================================================================

IntegerField::IntegerField(std::string name,
                           std::vector<Validator> validators,
                           std::optional<int64_t> default_value,
                           std::string label)
    : Field(std::move(name), std::move(validators), std::move(label))
    , default_(default_value)
    , data_(default_value)
{}

std::optional<std::string> IntegerField::text() const {
    if (!data_) return std::nullopt;
    return std::to_string(*data_);
}

std::string IntegerField::render_value() const {
    // Echo what was typed when it did not convert
    if (!data_ && raw_data() && !raw_data()->empty()) {
        return raw_data()->front();
    }
    return text().value_or("");
}

std::optional<std::string> IntegerField::process_formdata(const std::vector<const FormField*>& values) {
    if (values.empty()) {
        return std::nullopt;
    }

    std::string_view raw = values.front()->value;
    while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.front()))) raw.remove_prefix(1);
    while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back()))) raw.remove_suffix(1);

    auto parsed = from_string<int64_t>(raw);
    if (!parsed) {
        data_.reset();
        return "Not a valid integer value.";
    }
    data_ = *parsed;
    return std::nullopt;
}

// ============================================================================
// BooleanField
// ============================================================================

BooleanField::BooleanField(std::string name,
                           std::vector<Validator> validators,
                           bool default_value,
                           std::string label)
    : Field(std::move(name), std::move(validators), std::move(label))
    , default_(default_value)
    , data_(default_value)
{}

std::optional<std::string> BooleanField::process_formdata(const std::vector<const FormField*>& values) {
    // An unchecked box is absent from the submission
    if (values.empty()) {
        data_ = false;
        return std::nullopt;
    }
    const auto& value = values.front()->value;
    data_ = !(value.empty() || value == "false");
    return std::nullopt;
}

// ============================================================================
// FileField
// ============================================================================

FileField::FileField(std::string name, std::vector<Validator> validators, std::string label)
    : Field(std::move(name), std::move(validators), std::move(label))
{}

std::optional<std::string> FileField::text() const {
    if (!data_) return std::nullopt;
    return data_->is_file ? data_->filename : data_->value;
}

std::optional<std::string> FileField::process_formdata(const std::vector<const FormField*>& values) {
    if (!values.empty()) {
        data_ = *values.front();
    }
    return std::nullopt;
}

// ============================================================================
// CsrfTokenField
// ============================================================================

CsrfTokenField::CsrfTokenField(Request& req, std::shared_ptr<const CsrfConfig> config)
    : HiddenField(config->field_name, {}, std::nullopt, "CSRF Token")
    , request_(&req)
    , config_(std::move(config))
    , current_token_(csrf_token(req))
{}

ValidationResult CsrfTokenField::pre_validate(Form&) {
    if (auto* state = request_->find_state<CsrfState>(); state && state->validated) {
        return std::nullopt;
    }

    auto sess = session(*request_);
    if (!sess) {
        throw std::logic_error("CSRF protection used without the session middleware");
    }

    auto valid = validate_token(*sess, data().value_or(""), config_->secret,
                                config_->field_name, config_->time_limit);
    if (!valid) {
        return ValidationFailure::error(std::string(valid.error().message()));
    }
    return std::nullopt;
}

} // namespace coroform
