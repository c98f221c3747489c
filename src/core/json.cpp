#include "core/json.hpp"

#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>

namespace sqlgate::json {

namespace {

template <typename T>
void append_json(std::string& out, const T& value) {
    std::string buffer;
    const auto ec = glz::write_json(value, buffer);
    if (ec) {
        throw std::runtime_error("JSON serialization failed");
    }
    out += buffer;
}

} // anonymous namespace

std::optional<Json> parse(std::string_view text) {
    Json result;
    const std::string buffer(text);
    const auto ec = glz::read_json(result, buffer);
    if (ec) {
        return std::nullopt;
    }
    return result;
}

std::string dump(const Json& value) {
    std::string buffer;
    const auto ec = glz::write_json(value, buffer);
    if (ec) {
        throw std::runtime_error("JSON serialization failed");
    }
    return buffer;
}

Json make_object() {
    Json j;
    j = Json::object_t{};
    return j;
}

Json make_array() {
    Json j;
    j = Json::array_t{};
    return j;
}

// ============================================================================
// Field access
// ============================================================================

const Json* field(const Json& object, std::string_view key) {
    if (!object.is_object()) return nullptr;
    const auto& obj = object.get_object();
    const auto it = obj.find(key);
    if (it == obj.end()) return nullptr;
    return &it->second;
}

std::optional<std::string> string_field(const Json& object, std::string_view key) {
    const auto* v = field(object, key);
    if (!v || !v->is_string()) return std::nullopt;
    return v->get<std::string>();
}

std::optional<int64_t> int_field(const Json& object, std::string_view key) {
    const auto* v = field(object, key);
    if (!v || !v->is_number()) return std::nullopt;
    const double d = v->get<double>();
    if (!std::isfinite(d)) return std::nullopt;
    return static_cast<int64_t>(std::llround(d));
}

std::optional<bool> bool_field(const Json& object, std::string_view key) {
    const auto* v = field(object, key);
    if (!v || !v->is_boolean()) return std::nullopt;
    return v->get<bool>();
}

// ============================================================================
// Raw member access
// ============================================================================

std::optional<std::string> member_text(std::string_view object_text, std::string_view key) {
    std::map<std::string, glz::raw_json, std::less<>> members;
    const std::string buffer(object_text);
    const auto ec = glz::read_json(members, buffer);
    if (ec) {
        return std::nullopt;
    }
    const auto it = members.find(key);
    if (it == members.end()) return std::nullopt;
    return it->second.str;
}

std::optional<std::string> first_element_text(std::string_view array_text) {
    std::vector<glz::raw_json> elements;
    const std::string buffer(array_text);
    const auto ec = glz::read_json(elements, buffer);
    if (ec || elements.empty()) {
        return std::nullopt;
    }
    return elements.front().str;
}

// ============================================================================
// Row narrowing
// ============================================================================

CellValue cell_from_json(const Json& value) {
    if (value.is_null()) return std::monostate{};
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number()) {
        // json_t keeps every number as double; recover integers exactly when
        // they fit in the 53-bit mantissa.
        const double d = value.get<double>();
        constexpr double kMaxExact = 9007199254740992.0;  // 2^53
        if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) <= kMaxExact) {
            return static_cast<int64_t>(d);
        }
        return d;
    }
    // Arrays/objects are not scalars; keep their text.
    return dump(value);
}

std::optional<std::vector<Row>> rows_from_text(std::string_view array_text) {
    std::vector<OrderedMembers> objects;
    const std::string buffer(array_text);
    const auto ec = glz::read_json(objects, buffer);
    if (ec) {
        return std::nullopt;
    }

    std::vector<Row> rows;
    rows.reserve(objects.size());
    for (const auto& members : objects) {
        Row row;
        row.fields.reserve(members.size());
        for (const auto& [name, cell] : members) {
            row.fields.emplace_back(name, cell_from_json(cell));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

// ============================================================================
// Rendering
// ============================================================================

Json cell_to_json(const CellValue& cell) {
    Json j;
    std::visit([&j](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            j = nullptr;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            j = static_cast<double>(v);
        } else {
            j = v;
        }
    }, cell);
    return j;
}

std::string rows_to_text(const std::vector<Row>& rows) {
    std::string out = "[";
    for (size_t i = 0; i < rows.size(); ++i) {
        if (i > 0) out += ',';
        out += '{';
        const auto& fields = rows[i].fields;
        for (size_t f = 0; f < fields.size(); ++f) {
            if (f > 0) out += ',';
            append_json(out, fields[f].first);
            out += ':';
            append_json(out, cell_to_json(fields[f].second));
        }
        out += '}';
    }
    out += ']';
    return out;
}

std::string dump_with_rows(std::string_view rows_key, const std::vector<Row>& rows,
                           const Json& rest) {
    if (!rest.is_object()) {
        throw std::runtime_error("JSON serialization failed: rows must sit in an object");
    }
    std::string out = "{";
    append_json(out, std::string(rows_key));
    out += ':';
    out += rows_to_text(rows);

    // rest dumps as {...}; splice its members after the rows
    const auto tail = dump(rest);
    if (!rest.get_object().empty()) {
        out += ',';
        out.append(tail, 1, std::string::npos);
    } else {
        out += '}';
    }
    return out;
}

} // namespace sqlgate::json
