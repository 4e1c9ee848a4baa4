#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace adfmd {

// Closed set of node kinds. Any other type name is carried by `unknown`.
enum class node_kind
{
    doc,
    text,
    paragraph,
    heading,
    blockquote,
    code_block,
    bullet_list,
    ordered_list,
    list_item,
    hard_break,
    rule,
    inline_card,
    date,
    status,
    mention,
    emoji,
    table,
    table_row,
    table_cell,
    table_header,
    panel,
    media,
    media_single,
    media_group,
    media_inline,
    expand,
    nested_expand,
    caption,
    unknown
};

// Declared in canonical emission order.
enum class mark_kind
{
    code,
    em,
    strong,
    strike,
    link,
    underline,
    subsup,
    text_color,
    background_color,
    unknown
};

using attr_scalar = std::variant<std::string, std::int64_t, double, bool>;
using attr_list = std::vector<attr_scalar>;
// A JSON object attribute, kept as compact JSON text.
struct attr_json
{
    std::string _text;

    [[nodiscard]] bool operator==(const attr_json& rhs) const = default;
};

using attr_value = std::variant<std::string, std::int64_t, double, bool,
    attr_list, attr_json>;

// Attribute mapping that keeps declaration order.
class attributes
{
private:
    using entry = std::pair<std::string, attr_value>;
    std::vector<entry> _entries;

public:
    attributes() = default;
    attributes(std::initializer_list<entry> entries);

    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] const attr_value* find(
        const std::string_view name) const noexcept;

    [[nodiscard]] bool contains(const std::string_view name) const noexcept;

    // Replaces an existing value in place, appends otherwise.
    void set(std::string name, attr_value value);
    bool erase(const std::string_view name);

    [[nodiscard]] auto begin() const noexcept
    {
        return _entries.begin();
    }

    [[nodiscard]] auto end() const noexcept
    {
        return _entries.end();
    }

    [[nodiscard]] bool operator==(const attributes& rhs) const = default;
};

struct mark
{
    mark_kind _kind{mark_kind::unknown};
    std::string _unknown_type; // only set when `_kind == mark_kind::unknown`
    attributes _attrs;

    [[nodiscard]] bool operator==(const mark& rhs) const = default;
};

struct node
{
    node_kind _kind{node_kind::doc};
    std::string _unknown_type; // only set when `_kind == node_kind::unknown`
    attributes _attrs;
    std::vector<node> _content;

    // Text nodes only.
    std::string _text;
    std::vector<mark> _marks;
};

[[nodiscard]] bool operator==(const node& lhs, const node& rhs);
[[nodiscard]] bool operator!=(const node& lhs, const node& rhs);

// ----------------------------------------------------------------------------

[[nodiscard]] std::string_view to_string(const node_kind kind) noexcept;
[[nodiscard]] std::string_view to_string(const mark_kind kind) noexcept;

[[nodiscard]] std::optional<node_kind> node_kind_from_string(
    const std::string_view type) noexcept;

[[nodiscard]] std::optional<mark_kind> mark_kind_from_string(
    const std::string_view type) noexcept;

[[nodiscard]] std::string_view type_name(const node& n) noexcept;
[[nodiscard]] std::string_view type_name(const mark& m) noexcept;

[[nodiscard]] node make_node(const node_kind kind, attributes attrs = {},
    std::vector<node> content = {});

// Resolves `type` to a known kind, falling back to `node_kind::unknown`.
[[nodiscard]] node make_node(const std::string_view type,
    attributes attrs = {}, std::vector<node> content = {});

[[nodiscard]] node make_text(std::string text, std::vector<mark> marks = {});

[[nodiscard]] mark make_mark(const mark_kind kind, attributes attrs = {});
[[nodiscard]] mark make_mark(
    const std::string_view type, attributes attrs = {});

// Text, hard breaks, cards, dates, statuses, mentions, emojis and inline
// media live in inline content; everything else is block level.
[[nodiscard]] bool is_inline_kind(const node_kind kind) noexcept;

[[nodiscard]] bool is_leaf_kind(const node_kind kind) noexcept;

// Deepest nesting, in levels below the root, that either direction accepts.
inline constexpr std::size_t max_nesting_depth = 256;

[[nodiscard]] std::size_t canonical_rank(const mark_kind kind) noexcept;

// Stable, so unknown marks keep their relative order.
void sort_marks(std::vector<mark>& marks);

// ----------------------------------------------------------------------------
// Attribute schema
// ----------------------------------------------------------------------------

enum class attr_type
{
    string,
    number,
    boolean,
    number_list
};

[[nodiscard]] std::optional<attr_type> schema_type(
    const node_kind kind, const std::string_view name) noexcept;

// Marks are looked up by type name so unknown marks can carry a schema too.
[[nodiscard]] std::optional<attr_type> mark_schema_type(
    const std::string_view mark_type, const std::string_view name) noexcept;

// Name of the single parameter a mark carries, e.g. `href` for links.
[[nodiscard]] std::optional<std::string_view> primary_attribute(
    const mark_kind kind) noexcept;

[[nodiscard]] const std::string* get_string(
    const attributes& attrs, const std::string_view name) noexcept;

[[nodiscard]] std::optional<std::int64_t> get_integer(
    const attributes& attrs, const std::string_view name) noexcept;

} // namespace adfmd
