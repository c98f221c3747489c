#include "export/csv_exporter.hpp"

#include <format>
#include <type_traits>
#include <variant>

namespace sqlgate {

std::string CsvExporter::escape_field(std::string_view field) {
    if (field.find_first_of(",\"\n\r") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out;
    out.reserve(field.size() + 2);
    out += '"';
    for (const char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string CsvExporter::format_cell(const CellValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return {};
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return escape_field(v);
        } else {
            return std::format("{}", v);
        }
    }, value);
}

std::string CsvExporter::to_csv(const std::vector<Row>& rows) {
    if (rows.empty()) return {};

    std::vector<std::string> header;
    header.reserve(rows.front().fields.size());
    for (const auto& [name, _] : rows.front().fields) {
        header.push_back(name);
    }

    std::string out;
    for (size_t i = 0; i < header.size(); ++i) {
        if (i > 0) out += ',';
        out += escape_field(header[i]);
    }

    for (const auto& row : rows) {
        out += '\n';
        for (size_t i = 0; i < header.size(); ++i) {
            if (i > 0) out += ',';
            if (const auto* cell = row.find(header[i])) {
                out += format_cell(*cell);
            }
        }
    }
    return out;
}

} // namespace sqlgate
