#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sqlgate {

/**
 * @brief Rows → CSV text for the export endpoint
 *
 * Header comes from the first row's columns; later rows are written in that
 * column order (missing columns become empty fields). Lines are joined with
 * '\n' and there is no trailing newline. Empty input gives an empty string.
 */
class CsvExporter {
public:
    [[nodiscard]] static std::string to_csv(const std::vector<Row>& rows);

    /// Quotes the field when it contains a comma, quote or line break
    [[nodiscard]] static std::string escape_field(std::string_view field);

    /// null → "", bool → true/false, numbers in shortest form, text escaped
    [[nodiscard]] static std::string format_cell(const CellValue& value);
};

} // namespace sqlgate
