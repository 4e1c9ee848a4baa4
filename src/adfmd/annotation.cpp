#include "annotation.hpp"

#include "document.hpp"

#include <array>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cassert>
#include <cstddef>
#include <cstdint>

namespace adfmd {

namespace {

constexpr std::string_view tag_prefix = "ADF:";
constexpr std::string_view comment_open = "<!--";
constexpr std::string_view comment_close = "-->";

[[nodiscard]] bool is_escapable(const char c) noexcept
{
    return c == '\\' || c == '"' || c == ',' || c == '=' || c == ';' ||
           c == '>' || c == '|';
}

[[nodiscard]] bool is_name_char(const char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

[[nodiscard]] bool is_space(const char c) noexcept
{
    return c == ' ' || c == '\t';
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
    while (!s.empty() && is_space(s.front()))
    {
        s.remove_prefix(1);
    }

    while (!s.empty() && is_space(s.back()))
    {
        s.remove_suffix(1);
    }

    return s;
}

[[nodiscard]] std::size_t skip_spaces(
    const std::string_view s, std::size_t pos) noexcept
{
    while (pos < s.size() && is_space(s[pos]))
    {
        ++pos;
    }

    return pos;
}

// Index of the first `c` not escaped by a backslash, or `npos`.
[[nodiscard]] std::size_t find_unescaped(
    const std::string_view s, const char c) noexcept
{
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] == '\\')
        {
            ++i;
            continue;
        }

        if (s[i] == c)
        {
            return i;
        }
    }

    return std::string_view::npos;
}

// Index of the next top-level comma (outside quotes and brackets), or the
// end of `s`. JSON text keeps its quotes and commas escaped, so brackets only
// nest in a value that does not open with `{`.
[[nodiscard]] std::size_t find_attribute_end(
    const std::string_view s, std::size_t pos) noexcept
{
    bool in_quotes = false;
    std::size_t depth = 0;

    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t'))
    {
        ++pos;
    }

    const bool json = pos < s.size() && s[pos] == '{';

    for (; pos < s.size(); ++pos)
    {
        const char c = s[pos];

        if (json && c != '\\' && c != ',')
        {
            continue;
        }

        if (c == '\\')
        {
            ++pos;
            continue;
        }

        if (c == '"')
        {
            in_quotes = !in_quotes;
        }
        else if (!in_quotes && c == '[')
        {
            ++depth;
        }
        else if (!in_quotes && c == ']' && depth > 0)
        {
            --depth;
        }
        else if (!in_quotes && depth == 0 && c == ',')
        {
            return pos;
        }
    }

    return s.size();
}

[[nodiscard]] std::optional<attr_scalar> parse_number(
    const std::string_view s) noexcept
{
    if (s.empty())
    {
        return std::nullopt;
    }

    const char* const first = s.data();
    const char* const last = s.data() + s.size();

    {
        std::int64_t i{};
        const auto [ptr, ec] = std::from_chars(first, last, i);
        if (ec == std::errc{} && ptr == last)
        {
            return attr_scalar{i};
        }
    }

    {
        double d{};
        const auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec == std::errc{} && ptr == last)
        {
            return attr_scalar{d};
        }
    }

    return std::nullopt;
}

[[nodiscard]] std::optional<bool> parse_boolean(
    const std::string_view s) noexcept
{
    if (s == "true")
    {
        return true;
    }

    if (s == "false")
    {
        return false;
    }

    return std::nullopt;
}

[[nodiscard]] std::string scalar_text(const attr_scalar& value)
{
    return std::visit(
        [](const auto& v) -> std::string
        {
            using type = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<type, std::string>)
            {
                return v;
            }
            else if constexpr (std::is_same_v<type, bool>)
            {
                return v ? "true" : "false";
            }
            else if constexpr (std::is_same_v<type, double>)
            {
                return format_double(v);
            }
            else
            {
                return std::to_string(v);
            }
        },
        value);
}

[[nodiscard]] std::string scalar_literal(const attr_scalar& value)
{
    if (const auto* s = std::get_if<std::string>(&value))
    {
        return '"' + escape_value(*s) + '"';
    }

    return scalar_text(value);
}

[[nodiscard]] attr_scalar to_scalar(const attr_value& value)
{
    return std::visit(
        [](const auto& v) -> attr_scalar
        {
            using type = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<type, attr_list> ||
                          std::is_same_v<type, attr_json>)
            {
                assert(false);
                return std::string{};
            }
            else
            {
                return v;
            }
        },
        value);
}

// Bare literal spelling: `true`, `42`, `2.5`, `"text"`, `[1,"a"]`, and
// escaped JSON text such as `{\"k\":1}`.
[[nodiscard]] std::string value_literal(const attr_value& value)
{
    if (const auto* json = std::get_if<attr_json>(&value))
    {
        return escape_value(json->_text);
    }

    if (const auto* list = std::get_if<attr_list>(&value))
    {
        std::string result = "[";

        for (std::size_t i = 0; i < list->size(); ++i)
        {
            if (i > 0)
            {
                result += ',';
            }

            result += scalar_literal((*list)[i]);
        }

        result += ']';
        return result;
    }

    return scalar_literal(to_scalar(value));
}

[[nodiscard]] bool is_numeric(const attr_scalar& value) noexcept
{
    return std::holds_alternative<std::int64_t>(value) ||
           std::holds_alternative<double>(value);
}

[[nodiscard]] bool matches_schema(
    const attr_value& value, const attr_type type) noexcept
{
    switch (type)
    {
        case attr_type::string:
            return std::holds_alternative<std::string>(value);

        case attr_type::number:
            return std::holds_alternative<std::int64_t>(value) ||
                   std::holds_alternative<double>(value);

        case attr_type::boolean: return std::holds_alternative<bool>(value);

        case attr_type::number_list:
        {
            const auto* list = std::get_if<attr_list>(&value);
            if (list == nullptr)
            {
                return false;
            }

            for (const attr_scalar& item : *list)
            {
                if (!is_numeric(item))
                {
                    return false;
                }
            }

            return true;
        }
    }

    return false;
}

[[nodiscard]] std::optional<attr_value> parse_literal(std::string_view raw);

[[nodiscard]] std::optional<attr_value> parse_json_literal(
    const std::string_view raw)
{
    std::optional<std::string> text = unescape_value(raw);
    if (!text.has_value())
    {
        return std::nullopt;
    }

    return attr_value{attr_json{._text = std::move(*text)}};
}

// `[item,item]` where every item is a scalar literal.
[[nodiscard]] std::optional<attr_list> parse_list_literal(
    const std::string_view raw)
{
    const std::string_view inner = trim(raw.substr(1, raw.size() - 2));
    attr_list result;

    if (inner.empty())
    {
        return result;
    }

    std::size_t start = 0;
    while (start <= inner.size())
    {
        const std::size_t end = find_attribute_end(inner, start);
        const std::string_view item = trim(inner.substr(start, end - start));

        std::optional<attr_value> parsed = parse_literal(item);
        if (!parsed.has_value() ||
            std::holds_alternative<attr_list>(*parsed) ||
            std::holds_alternative<attr_json>(*parsed))
        {
            return std::nullopt;
        }

        result.emplace_back(to_scalar(*parsed));
        start = end + 1;
    }

    return result;
}

// Parses an escaped bare literal. Anything that is not a boolean, a number,
// a list, JSON text or a quoted string is taken as an (escaped) string.
[[nodiscard]] std::optional<attr_value> parse_literal(std::string_view raw)
{
    raw = trim(raw);

    if (const std::optional<bool> b = parse_boolean(raw))
    {
        return attr_value{*b};
    }

    if (const std::optional<attr_scalar> num = parse_number(raw))
    {
        if (const auto* i = std::get_if<std::int64_t>(&*num))
        {
            return attr_value{*i};
        }

        return attr_value{std::get<double>(*num)};
    }

    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"')
    {
        std::optional<std::string> s =
            unescape_value(raw.substr(1, raw.size() - 2));

        if (!s.has_value())
        {
            return std::nullopt;
        }

        return attr_value{std::move(*s)};
    }

    if (raw.size() >= 2 && raw.front() == '[' && raw.back() == ']')
    {
        std::optional<attr_list> list = parse_list_literal(raw);
        if (!list.has_value())
        {
            return std::nullopt;
        }

        return attr_value{std::move(*list)};
    }

    if (raw.size() >= 2 && raw.front() == '{' && raw.back() == '}')
    {
        return parse_json_literal(raw);
    }

    std::optional<std::string> s = unescape_value(raw);
    if (!s.has_value())
    {
        return std::nullopt;
    }

    return attr_value{std::move(*s)};
}

// Decodes an escaped value whose type is given by the schema. A value that
// does not parse as its type is kept as a string.
[[nodiscard]] std::optional<attr_value> parse_typed(
    const std::string_view raw, const attr_type type)
{
    if (type == attr_type::number_list)
    {
        attr_list result;

        if (raw.empty())
        {
            return attr_value{std::move(result)};
        }

        for (const std::string_view item : split_list(raw))
        {
            const std::optional<std::string> text = unescape_value(item);
            if (!text.has_value())
            {
                return std::nullopt;
            }

            const std::optional<attr_scalar> num = parse_number(*text);
            if (!num.has_value())
            {
                std::optional<std::string> whole = unescape_value(raw);
                if (!whole.has_value())
                {
                    return std::nullopt;
                }

                return attr_value{std::move(*whole)};
            }

            result.emplace_back(*num);
        }

        return attr_value{std::move(result)};
    }

    std::optional<std::string> text = unescape_value(raw);
    if (!text.has_value())
    {
        return std::nullopt;
    }

    if (type == attr_type::number)
    {
        if (const std::optional<attr_scalar> num = parse_number(*text))
        {
            if (const auto* i = std::get_if<std::int64_t>(&*num))
            {
                return attr_value{*i};
            }

            return attr_value{std::get<double>(*num)};
        }
    }
    else if (type == attr_type::boolean)
    {
        if (const std::optional<bool> b = parse_boolean(*text))
        {
            return attr_value{*b};
        }
    }

    return attr_value{std::move(*text)};
}

} // namespace

//
// Value escaping
// ----------------------------------------------------------------------------

std::string escape_value(const std::string_view value)
{
    std::string result;
    result.reserve(value.size());

    for (const char c : value)
    {
        if (is_escapable(c))
        {
            result += '\\';
            result += c;
        }
        else if (c == '\n')
        {
            result += "\\n";
        }
        else if (c == '\r')
        {
            result += "\\r";
        }
        else
        {
            result += c;
        }
    }

    return result;
}

std::optional<std::string> unescape_value(const std::string_view raw)
{
    std::string result;
    result.reserve(raw.size());

    for (std::size_t i = 0; i < raw.size(); ++i)
    {
        if (raw[i] != '\\')
        {
            result += raw[i];
            continue;
        }

        if (i + 1 >= raw.size())
        {
            return std::nullopt;
        }

        const char next = raw[++i];

        if (is_escapable(next))
        {
            result += next;
        }
        else if (next == 'n')
        {
            result += '\n';
        }
        else if (next == 'r')
        {
            result += '\r';
        }
        else
        {
            return std::nullopt;
        }
    }

    return result;
}

std::vector<std::string_view> split_list(
    const std::string_view raw, const char separator)
{
    std::vector<std::string_view> result;
    std::size_t start = 0;

    for (std::size_t i = 0; i < raw.size(); ++i)
    {
        if (raw[i] == '\\')
        {
            ++i;
            continue;
        }

        if (raw[i] == separator)
        {
            result.push_back(raw.substr(start, i - start));
            start = i + 1;
        }
    }

    result.push_back(raw.substr(start));
    return result;
}

bool is_valid_kind_name(const std::string_view kind) noexcept
{
    if (kind.empty())
    {
        return false;
    }

    for (const char c : kind)
    {
        if (!is_name_char(c))
        {
            return false;
        }
    }

    return true;
}

//
// Tags and markers
// ----------------------------------------------------------------------------

const tag_attribute* tag::find(const std::string_view name) const noexcept
{
    for (const tag_attribute& a : _attributes)
    {
        if (a._name == name)
        {
            return &a;
        }
    }

    return nullptr;
}

std::string encode_tag(const tag& t)
{
    std::string result{tag_prefix};
    result += t._kind;

    for (std::size_t i = 0; i < t._attributes.size(); ++i)
    {
        const tag_attribute& a = t._attributes[i];

        result += i == 0 ? ':' : ',';
        result += a._name;
        result += '=';

        if (a._quoted)
        {
            result += '"';
            result += a._raw;
            result += '"';
        }
        else
        {
            result += a._raw;
        }
    }

    return result;
}

std::optional<tag> decode_tag(
    const std::string_view text, decode_warnings& warnings)
{
    const std::string_view s = trim(text);

    if (s.substr(0, tag_prefix.size()) != tag_prefix)
    {
        return std::nullopt;
    }

    std::size_t pos = tag_prefix.size();
    const std::size_t kind_start = pos;

    while (pos < s.size() && is_name_char(s[pos]))
    {
        ++pos;
    }

    tag result;
    result._kind = std::string{s.substr(kind_start, pos - kind_start)};

    if (result._kind.empty())
    {
        return std::nullopt;
    }

    if (pos == s.size())
    {
        return result;
    }

    if (s[pos] != ':')
    {
        return std::nullopt;
    }

    ++pos;

    const auto skip_malformed = [&](const std::string_view reason)
    {
        const std::size_t end = find_attribute_end(s, pos);

        warnings.emplace_back("dropped malformed attribute '" +
                              std::string{trim(s.substr(pos, end - pos))} +
                              "' in '" + result._kind + "' tag (" +
                              std::string{reason} + ")");

        pos = end < s.size() ? end + 1 : end;
    };

    while (true)
    {
        pos = skip_spaces(s, pos);
        if (pos >= s.size())
        {
            break;
        }

        const std::size_t name_start = pos;
        while (pos < s.size() && (is_name_char(s[pos]) || s[pos] == '.'))
        {
            ++pos;
        }

        const std::string_view name =
            s.substr(name_start, pos - name_start);

        if (name.empty())
        {
            pos = name_start;
            skip_malformed("missing attribute name");
            continue;
        }

        pos = skip_spaces(s, pos);
        if (pos >= s.size() || s[pos] != '=')
        {
            pos = name_start;
            skip_malformed("missing '='");
            continue;
        }

        pos = skip_spaces(s, pos + 1);

        tag_attribute attribute;
        attribute._name = std::string{name};

        if (pos < s.size() && s[pos] == '"')
        {
            std::size_t end = pos + 1;
            while (end < s.size() && s[end] != '"')
            {
                end += s[end] == '\\' ? 2 : 1;
            }

            if (end >= s.size())
            {
                warnings.emplace_back("dropped attribute '" +
                                      attribute._name + "' in '" +
                                      result._kind +
                                      "' tag (unterminated quote)");
                break;
            }

            attribute._raw = std::string{s.substr(pos + 1, end - pos - 1)};
            attribute._quoted = true;
            pos = end + 1;
        }
        else
        {
            const std::size_t end = find_attribute_end(s, pos);
            attribute._raw = std::string{trim(s.substr(pos, end - pos))};
            attribute._quoted = false;
            pos = end;

            if (attribute._raw.empty())
            {
                warnings.emplace_back("dropped attribute '" +
                                      attribute._name + "' in '" +
                                      result._kind + "' tag (missing value)");

                pos = pos < s.size() ? pos + 1 : pos;
                continue;
            }
        }

        if (!unescape_value(attribute._raw).has_value())
        {
            warnings.emplace_back("dropped attribute '" + attribute._name +
                                  "' in '" + result._kind +
                                  "' tag (invalid escape sequence)");
        }
        else
        {
            result._attributes.push_back(std::move(attribute));
        }

        pos = skip_spaces(s, pos);
        if (pos >= s.size())
        {
            break;
        }

        if (s[pos] == ',')
        {
            ++pos;
            continue;
        }

        skip_malformed("unexpected character after value");
    }

    return result;
}

std::string open_marker(const tag& t)
{
    return "<!-- " + encode_tag(t) + " -->";
}

std::string close_marker(const std::string_view kind)
{
    std::string result{"<!-- /"};
    result += tag_prefix;
    result += kind;
    result += " -->";
    return result;
}

std::optional<marker> match_marker(const std::string_view source,
    const std::size_t pos, decode_warnings& warnings)
{
    if (source.substr(pos, comment_open.size()) != comment_open)
    {
        return std::nullopt;
    }

    const std::size_t inner_start = pos + comment_open.size();
    const std::size_t end = source.find(comment_close, inner_start);

    if (end == std::string_view::npos)
    {
        return std::nullopt;
    }

    const std::string_view inner =
        trim(source.substr(inner_start, end - inner_start));

    const std::size_t length = end + comment_close.size() - pos;

    if (!inner.empty() && inner.front() == '/')
    {
        const std::string_view rest = inner.substr(1);
        if (rest.substr(0, tag_prefix.size()) != tag_prefix)
        {
            return std::nullopt;
        }

        const std::string_view kind = trim(rest.substr(tag_prefix.size()));
        if (!is_valid_kind_name(kind))
        {
            return std::nullopt;
        }

        return marker{marker::type::close, tag{std::string{kind}, {}}, length};
    }

    std::optional<tag> decoded = decode_tag(inner, warnings);
    if (!decoded.has_value())
    {
        return std::nullopt;
    }

    return marker{marker::type::open, std::move(*decoded), length};
}

//
// Attribute codec
// ----------------------------------------------------------------------------

std::string format_double(const double value)
{
    std::array<char, 64> buffer{};
    const auto [ptr, ec] =
        std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);

    assert(ec == std::errc{});
    std::string result{buffer.data(), ptr};

    // Keep doubles distinguishable from integers.
    if (result.find_first_of(".eEn") == std::string::npos)
    {
        result += ".0";
    }

    return result;
}

tag_attribute encode_attribute(const std::string_view name,
    const attr_value& value, const std::optional<attr_type> schema)
{
    tag_attribute result;
    result._name = std::string{name};

    if (schema.has_value() && matches_schema(value, *schema))
    {
        result._quoted = true;

        if (const auto* list = std::get_if<attr_list>(&value))
        {
            for (std::size_t i = 0; i < list->size(); ++i)
            {
                if (i > 0)
                {
                    result._raw += ',';
                }

                result._raw += escape_value(scalar_text((*list)[i]));
            }
        }
        else
        {
            result._raw = escape_value(scalar_text(to_scalar(value)));
        }

        return result;
    }

    if (const auto* s = std::get_if<std::string>(&value))
    {
        result._quoted = true;
        result._raw = escape_value(*s);
        return result;
    }

    result._quoted = false;
    result._raw = value_literal(value);
    return result;
}

std::optional<attr_value> decode_attribute(
    const tag_attribute& attribute, const std::optional<attr_type> schema)
{
    if (!attribute._quoted)
    {
        return parse_literal(attribute._raw);
    }

    if (schema.has_value())
    {
        return parse_typed(attribute._raw, *schema);
    }

    std::optional<std::string> text = unescape_value(attribute._raw);
    if (!text.has_value())
    {
        return std::nullopt;
    }

    return attr_value{std::move(*text)};
}

tag make_tag(const node& n)
{
    tag result;
    result._kind = std::string{type_name(n)};

    for (const auto& [name, value] : n._attrs)
    {
        result._attributes.push_back(
            encode_attribute(name, value, schema_type(n._kind, name)));
    }

    return result;
}

attributes read_attributes(
    const tag& t, const node_kind kind, decode_warnings& warnings)
{
    attributes result;

    for (const tag_attribute& a : t._attributes)
    {
        std::optional<attr_value> value =
            decode_attribute(a, schema_type(kind, a._name));

        if (!value.has_value())
        {
            warnings.emplace_back("dropped attribute '" + a._name + "' in '" +
                                  t._kind + "' tag (malformed value)");
            continue;
        }

        result.set(a._name, std::move(*value));
    }

    return result;
}

//
// Marks list
// ----------------------------------------------------------------------------

namespace {

// Mark values sit inside the quoted `marks` value, so a string that must
// keep its type is written between escaped quotes.
constexpr std::string_view mark_quote = "\\\"";

[[nodiscard]] std::string quoted_mark_value(const std::string& text)
{
    std::string result{mark_quote};
    result += escape_value(text);
    result += mark_quote;
    return result;
}

[[nodiscard]] std::string mark_value_text(
    const attr_value& value, const std::optional<attr_type> schema)
{
    const auto* s = std::get_if<std::string>(&value);

    if (schema.has_value() && *schema != attr_type::number_list &&
        matches_schema(value, *schema) &&
        (s == nullptr || !s->starts_with('"')))
    {
        return escape_value(scalar_text(to_scalar(value)));
    }

    if (s != nullptr)
    {
        return quoted_mark_value(*s);
    }

    return escape_value(value_literal(value));
}

[[nodiscard]] std::optional<attr_value> decode_mark_value(
    const std::string_view raw, const std::optional<attr_type> schema)
{
    if (raw.size() >= 2 * mark_quote.size() && raw.starts_with(mark_quote) &&
        raw.ends_with(mark_quote))
    {
        std::optional<std::string> text = unescape_value(raw.substr(
            mark_quote.size(), raw.size() - 2 * mark_quote.size()));

        if (!text.has_value())
        {
            return std::nullopt;
        }

        return attr_value{std::move(*text)};
    }

    if (schema.has_value() && *schema != attr_type::number_list)
    {
        return parse_typed(raw, *schema);
    }

    std::optional<std::string> text = unescape_value(raw);
    if (!text.has_value())
    {
        return std::nullopt;
    }

    if (const std::optional<bool> b = parse_boolean(*text))
    {
        return attr_value{*b};
    }

    if (const std::optional<attr_scalar> num = parse_number(*text))
    {
        if (const auto* i = std::get_if<std::int64_t>(&*num))
        {
            return attr_value{*i};
        }

        return attr_value{std::get<double>(*num)};
    }

    if (text->size() >= 2 &&
        ((text->front() == '[' && text->back() == ']') ||
            (text->front() == '{' && text->back() == '}')))
    {
        if (std::optional<attr_value> parsed = parse_literal(*text))
        {
            return parsed;
        }
    }

    return attr_value{std::move(*text)};
}

[[nodiscard]] std::string encode_mark(const mark& m)
{
    const std::string_view name = type_name(m);
    std::string result{name};

    if (m._attrs.empty())
    {
        return result;
    }

    const std::optional<std::string_view> primary = primary_attribute(m._kind);
    if (primary.has_value() && m._attrs.size() == 1)
    {
        const auto& [attr_name, value] = *m._attrs.begin();
        if (attr_name == *primary && std::holds_alternative<std::string>(value))
        {
            result += '=';
            result += mark_value_text(value, mark_schema_type(name, attr_name));
            return result;
        }
    }

    for (const auto& [attr_name, value] : m._attrs)
    {
        result += ';';
        result += escape_value(attr_name);
        result += '=';
        result += mark_value_text(value, mark_schema_type(name, attr_name));
    }

    return result;
}

} // namespace

std::string encode_marks(const std::vector<mark>& marks)
{
    std::string result;

    for (std::size_t i = 0; i < marks.size(); ++i)
    {
        if (i > 0)
        {
            result += ',';
        }

        result += encode_mark(marks[i]);
    }

    return result;
}

std::vector<mark> decode_marks(
    const std::string_view raw, decode_warnings& warnings)
{
    std::vector<mark> result;

    for (const std::string_view item : split_list(raw, ','))
    {
        if (trim(item).empty())
        {
            continue;
        }

        const std::vector<std::string_view> segments = split_list(item, ';');
        assert(!segments.empty());

        const std::string_view head = segments[0];
        const std::size_t eq = find_unescaped(head, '=');
        const std::string_view name = trim(head.substr(0, eq));

        if (!is_valid_kind_name(name))
        {
            warnings.emplace_back(
                "dropped malformed mark '" + std::string{item} + "'");
            continue;
        }

        mark m = make_mark(name);

        if (eq != std::string_view::npos)
        {
            const std::optional<std::string_view> primary =
                primary_attribute(m._kind);

            const std::optional<attr_value> value =
                decode_mark_value(head.substr(eq + 1),
                    mark_schema_type(name, primary.value_or("")));

            if (!primary.has_value() || !value.has_value())
            {
                warnings.emplace_back("dropped value of mark '" +
                                      std::string{name} + "'");
            }
            else
            {
                m._attrs.set(std::string{*primary}, *value);
            }
        }

        for (std::size_t i = 1; i < segments.size(); ++i)
        {
            const std::string_view segment = segments[i];
            const std::size_t seg_eq = find_unescaped(segment, '=');

            if (seg_eq == std::string_view::npos)
            {
                warnings.emplace_back("dropped attribute '" +
                                      std::string{segment} + "' of mark '" +
                                      std::string{name} + "' (missing '=')");
                continue;
            }

            const std::optional<std::string> attr_name =
                unescape_value(trim(segment.substr(0, seg_eq)));

            const std::optional<attr_value> value =
                attr_name.has_value()
                    ? decode_mark_value(segment.substr(seg_eq + 1),
                          mark_schema_type(name, *attr_name))
                    : std::nullopt;

            if (!value.has_value())
            {
                warnings.emplace_back("dropped attribute '" +
                                      std::string{segment} + "' of mark '" +
                                      std::string{name} +
                                      "' (malformed value)");
                continue;
            }

            m._attrs.set(*attr_name, *value);
        }

        result.push_back(std::move(m));
    }

    return result;
}

} // namespace adfmd
