#include "document.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace adfmd {

attributes::attributes(std::initializer_list<entry> entries)
{
    for (const entry& e : entries)
    {
        set(e.first, e.second);
    }
}

bool attributes::empty() const noexcept
{
    return _entries.empty();
}

std::size_t attributes::size() const noexcept
{
    return _entries.size();
}

const attr_value* attributes::find(const std::string_view name) const noexcept
{
    for (const entry& e : _entries)
    {
        if (e.first == name)
        {
            return &e.second;
        }
    }

    return nullptr;
}

bool attributes::contains(const std::string_view name) const noexcept
{
    return find(name) != nullptr;
}

void attributes::set(std::string name, attr_value value)
{
    for (entry& e : _entries)
    {
        if (e.first == name)
        {
            e.second = std::move(value);
            return;
        }
    }

    _entries.emplace_back(std::move(name), std::move(value));
}

bool attributes::erase(const std::string_view name)
{
    const auto it = std::find_if(_entries.begin(), _entries.end(),
        [&](const entry& e) { return e.first == name; });

    if (it == _entries.end())
    {
        return false;
    }

    _entries.erase(it);
    return true;
}

bool operator==(const node& lhs, const node& rhs)
{
    return lhs._kind == rhs._kind && lhs._unknown_type == rhs._unknown_type &&
           lhs._attrs == rhs._attrs && lhs._text == rhs._text &&
           lhs._marks == rhs._marks && lhs._content == rhs._content;
}

bool operator!=(const node& lhs, const node& rhs)
{
    return !(lhs == rhs);
}

//
// Kind names
// ----------------------------------------------------------------------------

namespace {

struct node_kind_name
{
    node_kind _kind;
    std::string_view _name;
};

constexpr std::array<node_kind_name, 28> node_kind_names{{
    {node_kind::doc, "doc"},
    {node_kind::text, "text"},
    {node_kind::paragraph, "paragraph"},
    {node_kind::heading, "heading"},
    {node_kind::blockquote, "blockquote"},
    {node_kind::code_block, "codeBlock"},
    {node_kind::bullet_list, "bulletList"},
    {node_kind::ordered_list, "orderedList"},
    {node_kind::list_item, "listItem"},
    {node_kind::hard_break, "hardBreak"},
    {node_kind::rule, "rule"},
    {node_kind::inline_card, "inlineCard"},
    {node_kind::date, "date"},
    {node_kind::status, "status"},
    {node_kind::mention, "mention"},
    {node_kind::emoji, "emoji"},
    {node_kind::table, "table"},
    {node_kind::table_row, "tableRow"},
    {node_kind::table_cell, "tableCell"},
    {node_kind::table_header, "tableHeader"},
    {node_kind::panel, "panel"},
    {node_kind::media, "media"},
    {node_kind::media_single, "mediaSingle"},
    {node_kind::media_group, "mediaGroup"},
    {node_kind::media_inline, "mediaInline"},
    {node_kind::expand, "expand"},
    {node_kind::nested_expand, "nestedExpand"},
    {node_kind::caption, "caption"},
}};

struct mark_kind_name
{
    mark_kind _kind;
    std::string_view _name;
};

constexpr std::array<mark_kind_name, 9> mark_kind_names{{
    {mark_kind::code, "code"},
    {mark_kind::em, "em"},
    {mark_kind::strong, "strong"},
    {mark_kind::strike, "strike"},
    {mark_kind::link, "link"},
    {mark_kind::underline, "underline"},
    {mark_kind::subsup, "subsup"},
    {mark_kind::text_color, "textColor"},
    {mark_kind::background_color, "backgroundColor"},
}};

} // namespace

std::string_view to_string(const node_kind kind) noexcept
{
    for (const node_kind_name& n : node_kind_names)
    {
        if (n._kind == kind)
        {
            return n._name;
        }
    }

    return "unknown";
}

std::string_view to_string(const mark_kind kind) noexcept
{
    for (const mark_kind_name& n : mark_kind_names)
    {
        if (n._kind == kind)
        {
            return n._name;
        }
    }

    return "unknown";
}

std::optional<node_kind> node_kind_from_string(
    const std::string_view type) noexcept
{
    for (const node_kind_name& n : node_kind_names)
    {
        if (n._name == type)
        {
            return n._kind;
        }
    }

    return std::nullopt;
}

std::optional<mark_kind> mark_kind_from_string(
    const std::string_view type) noexcept
{
    for (const mark_kind_name& n : mark_kind_names)
    {
        if (n._name == type)
        {
            return n._kind;
        }
    }

    return std::nullopt;
}

std::string_view type_name(const node& n) noexcept
{
    return n._kind == node_kind::unknown ? std::string_view{n._unknown_type}
                                        : to_string(n._kind);
}

std::string_view type_name(const mark& m) noexcept
{
    return m._kind == mark_kind::unknown ? std::string_view{m._unknown_type}
                                        : to_string(m._kind);
}

node make_node(
    const node_kind kind, attributes attrs, std::vector<node> content)
{
    node result;
    result._kind = kind;
    result._attrs = std::move(attrs);
    result._content = std::move(content);
    return result;
}

node make_node(
    const std::string_view type, attributes attrs, std::vector<node> content)
{
    const std::optional<node_kind> kind = node_kind_from_string(type);

    node result = make_node(kind.value_or(node_kind::unknown),
        std::move(attrs), std::move(content));

    if (!kind.has_value())
    {
        result._unknown_type = std::string{type};
    }

    return result;
}

node make_text(std::string text, std::vector<mark> marks)
{
    node result;
    result._kind = node_kind::text;
    result._text = std::move(text);
    result._marks = std::move(marks);
    return result;
}

mark make_mark(const mark_kind kind, attributes attrs)
{
    return mark{kind, {}, std::move(attrs)};
}

mark make_mark(const std::string_view type, attributes attrs)
{
    const std::optional<mark_kind> kind = mark_kind_from_string(type);

    if (kind.has_value())
    {
        return make_mark(*kind, std::move(attrs));
    }

    return mark{mark_kind::unknown, std::string{type}, std::move(attrs)};
}

bool is_inline_kind(const node_kind kind) noexcept
{
    switch (kind)
    {
        case node_kind::text:
        case node_kind::hard_break:
        case node_kind::inline_card:
        case node_kind::date:
        case node_kind::status:
        case node_kind::mention:
        case node_kind::emoji:
        case node_kind::media_inline: return true;

        case node_kind::doc:
        case node_kind::paragraph:
        case node_kind::heading:
        case node_kind::blockquote:
        case node_kind::code_block:
        case node_kind::bullet_list:
        case node_kind::ordered_list:
        case node_kind::list_item:
        case node_kind::rule:
        case node_kind::table:
        case node_kind::table_row:
        case node_kind::table_cell:
        case node_kind::table_header:
        case node_kind::panel:
        case node_kind::media:
        case node_kind::media_single:
        case node_kind::media_group:
        case node_kind::expand:
        case node_kind::nested_expand:
        case node_kind::caption:
        case node_kind::unknown: return false;
    }

    return false;
}

bool is_leaf_kind(const node_kind kind) noexcept
{
    switch (kind)
    {
        case node_kind::hard_break:
        case node_kind::rule:
        case node_kind::inline_card:
        case node_kind::date:
        case node_kind::status:
        case node_kind::mention:
        case node_kind::emoji:
        case node_kind::media:
        case node_kind::media_inline: return true;

        case node_kind::doc:
        case node_kind::text:
        case node_kind::paragraph:
        case node_kind::heading:
        case node_kind::blockquote:
        case node_kind::code_block:
        case node_kind::bullet_list:
        case node_kind::ordered_list:
        case node_kind::list_item:
        case node_kind::table:
        case node_kind::table_row:
        case node_kind::table_cell:
        case node_kind::table_header:
        case node_kind::panel:
        case node_kind::media_single:
        case node_kind::media_group:
        case node_kind::expand:
        case node_kind::nested_expand:
        case node_kind::caption:
        case node_kind::unknown: return false;
    }

    return false;
}

std::size_t canonical_rank(const mark_kind kind) noexcept
{
    return static_cast<std::size_t>(kind);
}

void sort_marks(std::vector<mark>& marks)
{
    std::stable_sort(marks.begin(), marks.end(),
        [](const mark& a, const mark& b)
        { return canonical_rank(a._kind) < canonical_rank(b._kind); });
}

//
// Attribute schema
// ----------------------------------------------------------------------------

namespace {

struct schema_entry
{
    std::string_view _name;
    attr_type _type;
};

[[nodiscard]] std::optional<attr_type> lookup(
    std::initializer_list<schema_entry> entries,
    const std::string_view name) noexcept
{
    for (const schema_entry& e : entries)
    {
        if (e._name == name)
        {
            return e._type;
        }
    }

    return std::nullopt;
}

constexpr attr_type str_t = attr_type::string;
constexpr attr_type num_t = attr_type::number;

} // namespace

std::optional<attr_type> schema_type(
    const node_kind kind, const std::string_view name) noexcept
{
    switch (kind)
    {
        case node_kind::doc: return lookup({{"version", num_t}}, name);
        case node_kind::heading: return lookup({{"level", num_t}}, name);
        case node_kind::code_block:
            return lookup({{"language", str_t}}, name);
        case node_kind::ordered_list:
            return lookup({{"order", num_t}}, name);
        case node_kind::panel: return lookup({{"panelType", str_t}}, name);

        case node_kind::expand:
        case node_kind::nested_expand:
            return lookup({{"title", str_t}}, name);

        case node_kind::table:
            return lookup({{"isNumberColumnEnabled", attr_type::boolean},
                              {"width", num_t}, {"layout", str_t},
                              {"displayMode", str_t}},
                name);

        case node_kind::table_cell:
        case node_kind::table_header:
            return lookup({{"colspan", num_t}, {"rowspan", num_t},
                              {"colwidth", attr_type::number_list},
                              {"background", str_t}},
                name);

        case node_kind::status:
            return lookup(
                {{"text", str_t}, {"color", str_t}, {"localId", str_t}}, name);

        case node_kind::mention:
            return lookup({{"id", str_t}, {"text", str_t}, {"userType", str_t},
                              {"accessLevel", str_t}},
                name);

        case node_kind::emoji:
            return lookup(
                {{"shortName", str_t}, {"id", str_t}, {"text", str_t}}, name);

        case node_kind::date: return lookup({{"timestamp", str_t}}, name);
        case node_kind::inline_card: return lookup({{"url", str_t}}, name);

        case node_kind::media:
        case node_kind::media_inline:
            return lookup({{"id", str_t}, {"type", str_t},
                              {"collection", str_t}, {"alt", str_t},
                              {"width", num_t}, {"height", num_t}},
                name);

        case node_kind::media_single:
            return lookup(
                {{"layout", str_t}, {"width", num_t}, {"widthType", str_t}},
                name);

        case node_kind::text:
        case node_kind::paragraph:
        case node_kind::blockquote:
        case node_kind::bullet_list:
        case node_kind::list_item:
        case node_kind::hard_break:
        case node_kind::rule:
        case node_kind::table_row:
        case node_kind::media_group:
        case node_kind::caption:
        case node_kind::unknown: return std::nullopt;
    }

    return std::nullopt;
}

std::optional<attr_type> mark_schema_type(
    const std::string_view mark_type, const std::string_view name) noexcept
{
    if (mark_type == "border")
    {
        return lookup({{"size", num_t}, {"color", str_t}}, name);
    }

    const std::optional<mark_kind> kind = mark_kind_from_string(mark_type);
    if (!kind.has_value())
    {
        return std::nullopt;
    }

    switch (*kind)
    {
        case mark_kind::link:
            return lookup({{"href", str_t}, {"title", str_t}}, name);

        case mark_kind::text_color:
        case mark_kind::background_color:
            return lookup({{"color", str_t}}, name);

        case mark_kind::subsup: return lookup({{"type", str_t}}, name);

        case mark_kind::code:
        case mark_kind::em:
        case mark_kind::strong:
        case mark_kind::strike:
        case mark_kind::underline:
        case mark_kind::unknown: return std::nullopt;
    }

    return std::nullopt;
}

std::optional<std::string_view> primary_attribute(const mark_kind kind) noexcept
{
    switch (kind)
    {
        case mark_kind::link: return "href";

        case mark_kind::text_color:
        case mark_kind::background_color: return "color";

        case mark_kind::subsup: return "type";

        case mark_kind::code:
        case mark_kind::em:
        case mark_kind::strong:
        case mark_kind::strike:
        case mark_kind::underline:
        case mark_kind::unknown: return std::nullopt;
    }

    return std::nullopt;
}

const std::string* get_string(
    const attributes& attrs, const std::string_view name) noexcept
{
    const attr_value* value = attrs.find(name);
    return value == nullptr ? nullptr : std::get_if<std::string>(value);
}

std::optional<std::int64_t> get_integer(
    const attributes& attrs, const std::string_view name) noexcept
{
    const attr_value* value = attrs.find(name);
    if (value == nullptr)
    {
        return std::nullopt;
    }

    if (const auto* i = std::get_if<std::int64_t>(value))
    {
        return *i;
    }

    return std::nullopt;
}

} // namespace adfmd
