#pragma once

#include "core/types.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlgate::json {

/**
 * @brief glz::json_t helpers shared by the envelope decoder and the HTTP layer
 *
 * The DOM type never crosses into the gateway: the remote client narrows it
 * into Row/ExecutionResult, and the HTTP layer builds it back up only when
 * rendering a response.
 */

using Json = glz::json_t;

/// Parse a JSON document. nullopt on any syntax error.
[[nodiscard]] std::optional<Json> parse(std::string_view text);

/// Serialize a JSON document. Throws std::runtime_error on failure.
[[nodiscard]] std::string dump(const Json& value);

[[nodiscard]] Json make_object();
[[nodiscard]] Json make_array();

// ---- Field access (object members, type-checked) ---------------------------

[[nodiscard]] const Json* field(const Json& object, std::string_view key);
[[nodiscard]] std::optional<std::string> string_field(const Json& object, std::string_view key);
[[nodiscard]] std::optional<int64_t> int_field(const Json& object, std::string_view key);
[[nodiscard]] std::optional<bool> bool_field(const Json& object, std::string_view key);

// ---- Raw member access -----------------------------------------------------

/// Unparsed text of one member of a JSON object. nullopt if the text is not
/// an object or the member is absent.
[[nodiscard]] std::optional<std::string> member_text(std::string_view object_text,
                                                     std::string_view key);

/// Unparsed text of the first element of a JSON array.
[[nodiscard]] std::optional<std::string> first_element_text(std::string_view array_text);

// ---- Row narrowing ---------------------------------------------------------

/// Object members in document order. json_t objects are sorted maps, so rows
/// are read through this type to keep the remote column order.
using OrderedMembers = std::vector<std::pair<std::string, Json>>;

/// Scalar narrowing: integral numbers become int64_t, nested values become
/// their JSON text.
[[nodiscard]] CellValue cell_from_json(const Json& value);

/// Parse a JSON array of objects into rows, one field per member in document
/// order. nullopt on a syntax error or a non-object element.
[[nodiscard]] std::optional<std::vector<Row>> rows_from_text(std::string_view array_text);

// ---- Rendering -------------------------------------------------------------

[[nodiscard]] Json cell_to_json(const CellValue& cell);

/// JSON array text of rows, members in Row::fields order.
[[nodiscard]] std::string rows_to_text(const std::vector<Row>& rows);

/**
 * @brief Serialize an object whose first member is a row array
 *
 * Produces {"<rows_key>":[...], <members of rest>}. `rest` must be an
 * object; its members follow in json_t order.
 */
[[nodiscard]] std::string dump_with_rows(std::string_view rows_key,
                                         const std::vector<Row>& rows,
                                         const Json& rest);

} // namespace sqlgate::json
