#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "coroform/core/error.hpp"
#include "coroform/core/request.hpp"
#include "coroform/coro/task.hpp"
#include "coroform/util/expected.hpp"

namespace coroform {

// ============================================================================
// Form Data Types
// ============================================================================

// One submitted value. File uploads keep their metadata.
struct FormField {
    std::string name;
    std::string value;

    std::string filename;
    std::string content_type;
    bool is_file = false;
};

// Multi-valued mapping in submission order
class FormData {
    std::vector<FormField> fields_;
    std::unordered_map<std::string, std::vector<size_t>> index_;

public:
    FormData() = default;
    FormData(std::initializer_list<std::pair<std::string, std::string>> values);

    void add(FormField field);
    void add(std::string name, std::string value);

    // First value
    std::optional<std::string_view> get(std::string_view name) const;

    std::vector<std::string_view> get_all(std::string_view name) const;

    const FormField* get_field(std::string_view name) const;
    std::vector<const FormField*> get_fields(std::string_view name) const;

    bool has(std::string_view name) const;

    const std::vector<FormField>& fields() const { return fields_; }

    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }
};

// ============================================================================
// Body Parsing
// ============================================================================

namespace form {

// application/x-www-form-urlencoded
expected<FormData, Error> parse_urlencoded(std::string_view body);

// multipart/form-data; boundary comes from the Content-Type parameter
expected<FormData, Error> parse_multipart(std::string_view body, std::string_view boundary);

// A JSON object flattened into form data: arrays become repeated values,
// strings their text, other scalars their JSON text, nulls are skipped.
// Anything but an object is a 400.
expected<FormData, Error> parse_json_object(std::string_view body);

std::optional<std::string> extract_boundary(std::string_view content_type);

// Picks the parser from the media type. Requests without a body type the
// parsers understand yield empty data.
expected<FormData, Error> parse(const Request& req);

} // namespace form

// Parsed submission of the request, computed once and cached on the request
Task<expected<FormData, Error>> read_formdata(Request& req);

} // namespace coroform
