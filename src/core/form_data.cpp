#include "coroform/core/form_data.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

namespace coroform {

// ============================================================================
// FormData Implementation
// ============================================================================

FormData::FormData(std::initializer_list<std::pair<std::string, std::string>> values) {
    for (const auto& [name, value] : values) {
        add(name, value);
    }
}

void FormData::add(FormField field) {
    index_[field.name].push_back(fields_.size());
    fields_.push_back(std::move(field));
}

void FormData::add(std::string name, std::string value) {
    FormField field;
    field.name = std::move(name);
    field.value = std::move(value);
    add(std::move(field));
}

std::optional<std::string_view> FormData::get(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return fields_[it->second.front()].value;
}

std::vector<std::string_view> FormData::get_all(std::string_view name) const {
    std::vector<std::string_view> result;
    auto it = index_.find(std::string(name));
    if (it != index_.end()) {
        for (size_t idx : it->second) {
            result.emplace_back(fields_[idx].value);
        }
    }
    return result;
}

const FormField* FormData::get_field(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end() || it->second.empty()) {
        return nullptr;
    }
    return &fields_[it->second.front()];
}

std::vector<const FormField*> FormData::get_fields(std::string_view name) const {
    std::vector<const FormField*> result;
    auto it = index_.find(std::string(name));
    if (it != index_.end()) {
        for (size_t idx : it->second) {
            result.push_back(&fields_[idx]);
        }
    }
    return result;
}

bool FormData::has(std::string_view name) const {
    return index_.count(std::string(name)) > 0;
}

namespace form {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return HeaderKeyEqual{}(a, b);
}

// Value of a parameter such as name="x" in a header value. Quotes are
// optional; the parameter name is matched case-insensitively.
std::optional<std::string> header_param(std::string_view header, std::string_view param) {
    size_t pos = 0;
    while (pos < header.size()) {
        auto semi = header.find(';', pos);
        auto part = trim(header.substr(pos, semi == std::string_view::npos ? std::string_view::npos : semi - pos));
        pos = semi == std::string_view::npos ? header.size() : semi + 1;

        auto eq = part.find('=');
        if (eq == std::string_view::npos) continue;
        if (!iequals(trim(part.substr(0, eq)), param)) continue;

        auto value = trim(part.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        return std::string(value);
    }
    return std::nullopt;
}

struct PartHeaders {
    std::string disposition;
    std::string content_type;
};

PartHeaders parse_part_headers(std::string_view block) {
    PartHeaders headers;
    while (!block.empty()) {
        auto eol = block.find("\r\n");
        auto line = block.substr(0, eol);
        block = eol == std::string_view::npos ? std::string_view{} : block.substr(eol + 2);

        auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;

        auto name = trim(line.substr(0, colon));
        auto value = trim(line.substr(colon + 1));
        if (iequals(name, "Content-Disposition")) {
            headers.disposition = std::string(value);
        } else if (iequals(name, "Content-Type")) {
            headers.content_type = std::string(value);
        }
    }
    return headers;
}

} // anonymous namespace

// ============================================================================
// URL-Encoded Form Parsing
// ============================================================================

expected<FormData, Error> parse_urlencoded(std::string_view body) {
    FormData data;

    while (!body.empty()) {
        auto amp = body.find('&');
        auto pair = body.substr(0, amp);
        body = amp == std::string_view::npos ? std::string_view{} : body.substr(amp + 1);

        auto eq = pair.find('=');
        std::string name = url_decode(pair.substr(0, eq));
        std::string value = eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));

        if (!name.empty()) {
            data.add(std::move(name), std::move(value));
        }
    }
    return data;
}

// ============================================================================
// Multipart Form Parsing
// ============================================================================

expected<FormData, Error> parse_multipart(std::string_view body, std::string_view boundary) {
    if (boundary.empty()) {
        return unexpected(Error::http(HttpError::BadRequest, "Empty multipart boundary"));
    }

    FormData data;
    const std::string delimiter = "--" + std::string(boundary);

    auto pos = body.find(delimiter);
    if (pos == std::string_view::npos) {
        return unexpected(Error::http(HttpError::BadRequest, "Multipart boundary not found"));
    }
    pos += delimiter.size();

    for (;;) {
        // "--" right after a delimiter closes the body
        if (body.substr(pos, 2) == "--") {
            return data;
        }
        if (body.substr(pos, 2) != "\r\n") {
            return unexpected(Error::http(HttpError::BadRequest, "Malformed multipart delimiter"));
        }
        pos += 2;

        auto headers_end = body.find("\r\n\r\n", pos);
        if (headers_end == std::string_view::npos) {
            return unexpected(Error::http(HttpError::BadRequest, "Unterminated multipart headers"));
        }
        auto headers = parse_part_headers(body.substr(pos, headers_end - pos));
        pos = headers_end + 4;

        auto next = body.find("\r\n" + delimiter, pos);
        if (next == std::string_view::npos) {
            return unexpected(Error::http(HttpError::BadRequest, "Unterminated multipart body"));
        }

        FormField field;
        field.name = header_param(headers.disposition, "name").value_or("");
        if (auto filename = header_param(headers.disposition, "filename")) {
            field.filename = std::move(*filename);
            field.is_file = true;
        }
        field.content_type = std::move(headers.content_type);
        field.value = std::string(body.substr(pos, next - pos));

        if (!field.name.empty()) {
            data.add(std::move(field));
        }
        pos = next + 2 + delimiter.size();
    }
}

std::optional<std::string> extract_boundary(std::string_view content_type) {
    auto boundary = header_param(content_type, "boundary");
    if (!boundary || boundary->empty()) {
        return std::nullopt;
    }
    return boundary;
}

// ============================================================================
// JSON Object Flattening
// ============================================================================

namespace {

void add_json_value(FormData& data, const std::string& name, const nlohmann::json& value) {
    if (value.is_null()) {
        return;
    }
    if (value.is_string()) {
        data.add(name, value.get<std::string>());
    } else {
        data.add(name, value.dump());
    }
}

} // anonymous namespace

expected<FormData, Error> parse_json_object(std::string_view body) {
    auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded()) {
        return unexpected(Error::http(HttpError::BadRequest, "Malformed JSON body"));
    }
    if (!doc.is_object()) {
        return unexpected(Error::http(HttpError::BadRequest, "JSON body must be an object"));
    }

    FormData data;
    for (const auto& [name, value] : doc.items()) {
        if (value.is_array()) {
            for (const auto& item : value) {
                add_json_value(data, name, item);
            }
        } else {
            add_json_value(data, name, value);
        }
    }
    return data;
}

// ============================================================================
// Content-Type Dispatch
// ============================================================================

expected<FormData, Error> parse(const Request& req) {
    auto media = req.media_type();

    if (media == "application/json") {
        return parse_json_object(req.body());
    }

    if (media == "application/x-www-form-urlencoded") {
        return parse_urlencoded(req.body());
    }

    if (media == "multipart/form-data") {
        auto boundary = extract_boundary(*req.content_type());
        if (!boundary) {
            return unexpected(Error::http(HttpError::BadRequest,
                "Missing boundary in multipart Content-Type"));
        }
        return parse_multipart(req.body(), *boundary);
    }

    return FormData{};
}

} // namespace form

// ============================================================================
// Request Body Cache
// ============================================================================

namespace {

struct ParsedBody {
    std::optional<FormData> data;
};

} // anonymous namespace

Task<expected<FormData, Error>> read_formdata(Request& req) {
    auto& cache = req.state<ParsedBody>();
    if (!cache.data) {
        auto parsed = form::parse(req);
        if (!parsed) {
            co_return unexpected(parsed.error());
        }
        cache.data = std::move(*parsed);
    }
    co_return *cache.data;
}

} // namespace coroform
