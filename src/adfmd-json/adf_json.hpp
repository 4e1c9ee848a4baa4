#pragma once

#include <adfmd/document.hpp>

#include <json/json.h>

#include <iosfwd>
#include <string>
#include <string_view>

namespace adfmd {

// Reads an ADF node from parsed JSON. Problems are written to `err_stream`
// with the JSON path of the offending node.
[[nodiscard]] bool node_from_json(
    const Json::Value& value, node& output, std::ostream& err_stream);

[[nodiscard]] Json::Value node_to_json(const node& n);

[[nodiscard]] bool read_adf_json(
    const std::string_view json, node& output, std::ostream& err_stream);

// Two-space indented.
[[nodiscard]] std::string write_adf_json(const node& n);

} // namespace adfmd
