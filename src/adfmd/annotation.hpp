#pragma once

#include "document.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cstddef>

namespace adfmd {

struct tag_attribute
{
    std::string _name;
    std::string _raw; // escaped value, without the surrounding quotes
    bool _quoted{true};

    [[nodiscard]] bool operator==(const tag_attribute& rhs) const = default;
};

// `ADF:{kind}:{name}={value},...`
struct tag
{
    std::string _kind;
    std::vector<tag_attribute> _attributes;

    [[nodiscard]] const tag_attribute* find(
        const std::string_view name) const noexcept;

    [[nodiscard]] bool operator==(const tag& rhs) const = default;
};

struct marker
{
    enum class type
    {
        open,
        close
    };

    type _type;
    tag _tag; // only the kind is set for close markers
    std::size_t _length;
};

// Warnings produced while decoding; the caller attaches source positions.
using decode_warnings = std::vector<std::string>;

//
// Value escaping
// ----------------------------------------------------------------------------

[[nodiscard]] std::string escape_value(const std::string_view value);

// Fails on an unknown escape or a trailing lone backslash.
[[nodiscard]] std::optional<std::string> unescape_value(
    const std::string_view raw);

// Splits on `separator` characters not preceded by an escaping backslash.
[[nodiscard]] std::vector<std::string_view> split_list(
    const std::string_view raw, const char separator = ',');

[[nodiscard]] bool is_valid_kind_name(const std::string_view kind) noexcept;

//
// Tags and markers
// ----------------------------------------------------------------------------

[[nodiscard]] std::string encode_tag(const tag& t);

[[nodiscard]] std::optional<tag> decode_tag(
    const std::string_view text, decode_warnings& warnings);

[[nodiscard]] std::string open_marker(const tag& t);
[[nodiscard]] std::string close_marker(const std::string_view kind);

[[nodiscard]] std::optional<marker> match_marker(const std::string_view source,
    const std::size_t pos, decode_warnings& warnings);

//
// Attribute codec
// ----------------------------------------------------------------------------

[[nodiscard]] std::string format_double(const double value);

[[nodiscard]] tag_attribute encode_attribute(const std::string_view name,
    const attr_value& value, const std::optional<attr_type> schema);

[[nodiscard]] std::optional<attr_value> decode_attribute(
    const tag_attribute& attribute, const std::optional<attr_type> schema);

// Tag named after the node's type carrying all of its attributes.
[[nodiscard]] tag make_tag(const node& n);

[[nodiscard]] attributes read_attributes(
    const tag& t, const node_kind kind, decode_warnings& warnings);

[[nodiscard]] std::string encode_marks(const std::vector<mark>& marks);

[[nodiscard]] std::vector<mark> decode_marks(
    const std::string_view raw, decode_warnings& warnings);

} // namespace adfmd
