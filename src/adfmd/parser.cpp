#include "parser.hpp"

#include "annotation.hpp"
#include "diagnostics.hpp"
#include "document.hpp"
#include "table_transformer.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace adfmd {

namespace {

struct source_line
{
    std::string_view _text;
    std::size_t _number; // 1-based
};

using line_list = std::vector<source_line>;

[[nodiscard]] bool is_space(const char c) noexcept
{
    return c == ' ' || c == '\t';
}

[[nodiscard]] bool is_digit(const char c) noexcept
{
    return c >= '0' && c <= '9';
}

[[nodiscard]] bool is_ascii_punct(const char c) noexcept
{
    return (c >= '!' && c <= '/') || (c >= ':' && c <= '@') ||
           (c >= '[' && c <= '`') || (c >= '{' && c <= '~');
}

[[nodiscard]] std::string_view trim_left(std::string_view s) noexcept
{
    while (!s.empty() && is_space(s.front()))
    {
        s.remove_prefix(1);
    }

    return s;
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
    s = trim_left(s);

    while (!s.empty() && is_space(s.back()))
    {
        s.remove_suffix(1);
    }

    return s;
}

[[nodiscard]] bool is_blank(const std::string_view s) noexcept
{
    return trim(s).empty();
}

[[nodiscard]] std::size_t run_length(
    const std::string_view s, const std::size_t pos, const char c) noexcept
{
    std::size_t result = 0;
    while (pos + result < s.size() && s[pos + result] == c)
    {
        ++result;
    }

    return result;
}

[[nodiscard]] line_list split_lines(const std::string_view text,
    const std::size_t first_number, const bool numbered)
{
    line_list result;
    std::size_t number = first_number;
    std::size_t start = 0;

    while (start < text.size())
    {
        const std::size_t end = std::min(text.find('\n', start), text.size());
        std::string_view line = text.substr(start, end - start);

        if (!line.empty() && line.back() == '\r')
        {
            line.remove_suffix(1);
        }

        result.push_back(source_line{._text = line, ._number = number});

        if (numbered)
        {
            ++number;
        }

        start = end + 1;
    }

    return result;
}

[[nodiscard]] std::string join_lines(const line_list& lines)
{
    std::string result;

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
        {
            result += '\n';
        }

        result += lines[i]._text;
    }

    return result;
}

//
// Block recognizers
// ----------------------------------------------------------------------------

// Length of the opening backtick fence, if `line` opens a code block.
[[nodiscard]] std::optional<std::size_t> fence_length(
    const std::string_view line) noexcept
{
    const std::string_view t = trim_left(line);
    const std::size_t n = run_length(t, 0, '`');

    if (n < 3 || t.find('`', n) != std::string_view::npos)
    {
        return std::nullopt;
    }

    return n;
}

[[nodiscard]] bool is_fence_close(
    const std::string_view line, const std::size_t n) noexcept
{
    const std::string_view t = trim(line);
    return t.size() >= n && run_length(t, 0, '`') == t.size();
}

[[nodiscard]] std::optional<std::size_t> heading_level(
    const std::string_view line) noexcept
{
    const std::size_t n = run_length(line, 0, '#');

    if (n < 1 || n > 6 || (n < line.size() && line[n] != ' '))
    {
        return std::nullopt;
    }

    return n;
}

[[nodiscard]] bool is_rule(const std::string_view line) noexcept
{
    const std::string_view t = trim(line);
    return t.size() >= 3 && run_length(t, 0, '-') == t.size();
}

struct list_marker
{
    bool _ordered;
    std::int64_t _number;
    std::size_t _width; // marker plus the following space
    std::string_view _rest;
};

[[nodiscard]] std::optional<list_marker> match_list_marker(
    const std::string_view line) noexcept
{
    const auto finish = [&](const bool ordered, const std::int64_t number,
                            const std::size_t marker_size)
        -> std::optional<list_marker>
    {
        if (line.size() > marker_size && line[marker_size] != ' ')
        {
            return std::nullopt;
        }

        const std::size_t width = marker_size + 1;
        return list_marker{._ordered = ordered,
            ._number = number,
            ._width = width,
            ._rest = line.size() > width ? line.substr(width)
                                         : std::string_view{}};
    };

    if (!line.empty() && line.front() == '-')
    {
        return finish(false, 0, 1);
    }

    std::size_t n_digits = 0;
    while (n_digits < line.size() && is_digit(line[n_digits]))
    {
        ++n_digits;
    }

    if (n_digits == 0 || n_digits > 18 || n_digits >= line.size() ||
        line[n_digits] != '.')
    {
        return std::nullopt;
    }

    std::int64_t number{};
    const auto [ptr, ec] =
        std::from_chars(line.data(), line.data() + n_digits, number);

    if (ec != std::errc{})
    {
        return std::nullopt;
    }

    return finish(true, number, n_digits + 1);
}

[[nodiscard]] std::string_view dequote(std::string_view line) noexcept
{
    if (!line.empty() && line.front() == '>')
    {
        line.remove_prefix(1);

        if (!line.empty() && line.front() == ' ')
        {
            line.remove_prefix(1);
        }
    }

    return line;
}

// Drops a bold label line and the blank line after it.
void drop_label(line_list& lines)
{
    if (!lines.empty())
    {
        lines.erase(lines.begin());
    }

    if (!lines.empty() && is_blank(lines.front()._text))
    {
        lines.erase(lines.begin());
    }
}

//
// Marker recognizers
// ----------------------------------------------------------------------------

// A line holding exactly one marker, open or close.
[[nodiscard]] std::optional<marker> whole_line_marker(
    const std::string_view line, decode_warnings& warnings)
{
    const std::string_view t = trim(line);

    if (!t.starts_with("<!--"))
    {
        return std::nullopt;
    }

    std::optional<marker> m = match_marker(t, 0, warnings);
    if (!m.has_value() || m->_length != t.size())
    {
        return std::nullopt;
    }

    return m;
}

[[nodiscard]] std::optional<std::size_t> find_code_close(
    const std::string_view s, std::size_t from, const std::size_t n) noexcept
{
    while (from < s.size())
    {
        if (s[from] != '`')
        {
            ++from;
            continue;
        }

        const std::size_t run = run_length(s, from, '`');
        if (run == n)
        {
            return from;
        }

        from += run;
    }

    return std::nullopt;
}

// Position after the code span opening at `pos`, or after its backtick run
// when the span is not closed.
[[nodiscard]] std::size_t skip_code_span(
    const std::string_view s, const std::size_t pos) noexcept
{
    const std::size_t n = run_length(s, pos, '`');
    const std::optional<std::size_t> close = find_code_close(s, pos + n, n);

    return close.has_value() ? *close + n : pos + n;
}

[[nodiscard]] std::size_t skip_marker(
    const std::string_view s, const std::size_t pos)
{
    decode_warnings scratch;
    const std::optional<marker> m = match_marker(s, pos, scratch);

    return m.has_value() ? pos + m->_length : pos + 4;
}

struct element_end
{
    std::size_t _body_end;
    std::size_t _close_end;
};

// Finds the close marker of `kind` balancing an open marker whose body
// starts at `from`. On failure, the body starts of the later opens of `kind`
// that cannot be balanced either are added to `unmatched`.
[[nodiscard]] std::optional<element_end> find_element_end(
    const std::string_view s, std::size_t from, const std::string_view kind,
    std::unordered_map<std::size_t, std::string>* unmatched = nullptr)
{
    struct visit
    {
        bool _open;
        std::size_t _body_start;
        std::size_t _depth;
    };

    std::vector<visit> visits;
    std::size_t depth = 1;

    while (from < s.size())
    {
        const char c = s[from];

        if (c == '\\')
        {
            from += 2;
        }
        else if (c == '`')
        {
            from = skip_code_span(s, from);
        }
        else if (s.substr(from, 4) == "<!--")
        {
            decode_warnings scratch;
            const std::optional<marker> m = match_marker(s, from, scratch);

            if (!m.has_value())
            {
                from += 4;
                continue;
            }

            if (m->_tag._kind == kind)
            {
                if (m->_type == marker::type::open)
                {
                    ++depth;
                }
                else if (--depth == 0)
                {
                    return element_end{
                        ._body_end = from, ._close_end = from + m->_length};
                }

                if (unmatched != nullptr)
                {
                    visits.push_back(
                        visit{._open = m->_type == marker::type::open,
                            ._body_start = from + m->_length,
                            ._depth = depth});
                }
            }

            from += m->_length;
        }
        else
        {
            ++from;
        }
    }

    if (unmatched != nullptr)
    {
        // An open stays unbalanced when no later close drops below its depth.
        std::size_t lowest = std::numeric_limits<std::size_t>::max();

        for (auto it = visits.rbegin(); it != visits.rend(); ++it)
        {
            if (!it->_open)
            {
                lowest = std::min(lowest, it->_depth);
            }
            else if (lowest >= it->_depth)
            {
                unmatched->try_emplace(it->_body_start, kind);
            }
        }
    }

    return std::nullopt;
}

struct element_line
{
    tag _tag;
    std::string_view _body;
    decode_warnings _warnings;
};

// A line that is one `media`, `caption` or unknown-kind element from start to
// end.
[[nodiscard]] std::optional<element_line> match_element_line(
    const std::string_view line)
{
    decode_warnings warnings;
    std::optional<marker> open = match_marker(line, 0, warnings);

    if (!open.has_value() || open->_type != marker::type::open)
    {
        return std::nullopt;
    }

    const std::optional<node_kind> kind =
        node_kind_from_string(open->_tag._kind);

    if (kind.has_value() && *kind != node_kind::media &&
        *kind != node_kind::caption)
    {
        return std::nullopt;
    }

    const std::optional<element_end> end =
        find_element_end(line, open->_length, open->_tag._kind);

    if (!end.has_value() || end->_close_end != line.size())
    {
        return std::nullopt;
    }

    const std::string_view body =
        line.substr(open->_length, end->_body_end - open->_length);

    return element_line{._tag = std::move(open->_tag),
        ._body = body,
        ._warnings = std::move(warnings)};
}

[[nodiscard]] bool is_block_start(const std::string_view line)
{
    decode_warnings scratch;

    return whole_line_marker(line, scratch).has_value() ||
           fence_length(line).has_value() ||
           heading_level(line).has_value() || line.starts_with('>') ||
           is_rule(line) || match_list_marker(line).has_value();
}

//
// Inline helpers
// ----------------------------------------------------------------------------

// Decodes `&#N;` with an ASCII code point; returns the entity length.
[[nodiscard]] std::size_t match_entity(
    const std::string_view s, const std::size_t pos, char& decoded) noexcept
{
    if (s.substr(pos, 2) != "&#")
    {
        return 0;
    }

    const std::size_t semi = s.find(';', pos + 2);
    if (semi == std::string_view::npos || semi == pos + 2 || semi > pos + 5)
    {
        return 0;
    }

    unsigned value{};
    const auto [ptr, ec] =
        std::from_chars(s.data() + pos + 2, s.data() + semi, value);

    if (ec != std::errc{} || ptr != s.data() + semi || value > 127)
    {
        return 0;
    }

    decoded = static_cast<char>(value);
    return semi + 1 - pos;
}

// First run of at least `n` delimiters, skipping escapes, code spans and
// markers.
[[nodiscard]] std::optional<std::size_t> find_delimiter(
    const std::string_view s, std::size_t from, const char delimiter,
    const std::size_t n)
{
    while (from < s.size())
    {
        const char c = s[from];

        if (c == '\\')
        {
            from += 2;
        }
        else if (c == '`' && delimiter != '`')
        {
            from = skip_code_span(s, from);
        }
        else if (s.substr(from, 4) == "<!--")
        {
            from = skip_marker(s, from);
        }
        else if (c == delimiter)
        {
            const std::size_t run = run_length(s, from, delimiter);
            if (run >= n)
            {
                return from;
            }

            from += run;
        }
        else
        {
            ++from;
        }
    }

    return std::nullopt;
}

struct link_match
{
    std::string_view _label;
    std::string _href;
    bool _angle;
    std::size_t _end;
};

[[nodiscard]] std::string decode_destination(const std::string_view raw)
{
    std::string result;
    result.reserve(raw.size());

    for (std::size_t i = 0; i < raw.size(); ++i)
    {
        char decoded{};

        if (raw[i] == '\\' && i + 1 < raw.size() && is_ascii_punct(raw[i + 1]))
        {
            result += raw[++i];
        }
        else if (const std::size_t n = match_entity(raw, i, decoded); n > 0)
        {
            result += decoded;
            i += n - 1;
        }
        else
        {
            result += raw[i];
        }
    }

    return result;
}

[[nodiscard]] std::optional<link_match> match_link(
    const std::string_view s, const std::size_t pos)
{
    std::size_t i = pos + 1;
    std::size_t depth = 0;

    while (i < s.size())
    {
        const char c = s[i];

        if (c == '\\')
        {
            i += 2;
            continue;
        }

        if (c == '`')
        {
            i = skip_code_span(s, i);
            continue;
        }

        if (s.substr(i, 4) == "<!--")
        {
            i = skip_marker(s, i);
            continue;
        }

        if (c == '[')
        {
            ++depth;
        }
        else if (c == ']')
        {
            if (depth == 0)
            {
                break;
            }

            --depth;
        }

        ++i;
    }

    if (i + 1 >= s.size() || s[i + 1] != '(')
    {
        return std::nullopt;
    }

    const std::string_view label = s.substr(pos + 1, i - pos - 1);
    const std::size_t dest = i + 2;

    if (dest < s.size() && s[dest] == '<')
    {
        std::size_t k = dest + 1;

        while (k < s.size() && s[k] != '>' && s[k] != '\n')
        {
            k += s[k] == '\\' ? 2 : 1;
        }

        if (k + 1 >= s.size() || s[k] != '>' || s[k + 1] != ')')
        {
            return std::nullopt;
        }

        return link_match{._label = label,
            ._href = decode_destination(s.substr(dest + 1, k - dest - 1)),
            ._angle = true,
            ._end = k + 2};
    }

    std::size_t k = dest;
    while (k < s.size() && s[k] != ')' && !is_space(s[k]) && s[k] != '\n')
    {
        ++k;
    }

    if (k >= s.size() || s[k] != ')')
    {
        return std::nullopt;
    }

    return link_match{._label = label,
        ._href = decode_destination(s.substr(dest, k - dest)),
        ._angle = false,
        ._end = k + 1};
}

// The label as plain text, or nothing if it holds any inline syntax.
[[nodiscard]] std::optional<std::string> plain_label(const std::string_view s)
{
    std::string result;

    for (std::size_t i = 0; i < s.size(); ++i)
    {
        const char c = s[i];
        char decoded{};

        if (c == '\\')
        {
            if (i + 1 >= s.size() || !is_ascii_punct(s[i + 1]))
            {
                return std::nullopt;
            }

            result += s[++i];
        }
        else if (const std::size_t n = match_entity(s, i, decoded); n > 0)
        {
            result += decoded;
            i += n - 1;
        }
        else if (c == '*' || c == '`' || c == '~' || c == '[' || c == ']' ||
                 c == '\n' || s.substr(i, 4) == "<!--")
        {
            return std::nullopt;
        }
        else
        {
            result += c;
        }
    }

    return result;
}

// Line numbers of positions visited in increasing order.
class line_counter
{
private:
    std::string_view _source;
    std::size_t _pos{0};
    std::size_t _line;

public:
    [[nodiscard]] explicit line_counter(
        const std::string_view source, const std::size_t first_line) noexcept
        : _source{source}, _line{first_line}
    {
    }

    [[nodiscard]] std::size_t at(const std::size_t pos) noexcept
    {
        _line += static_cast<std::size_t>(
            std::count(_source.begin() + static_cast<std::ptrdiff_t>(_pos),
                _source.begin() + static_cast<std::ptrdiff_t>(pos), '\n'));

        _pos = pos;
        return _line;
    }
};

// Sorts marks and merges adjacent texts with identical marks and attributes.
void normalize_inlines(std::vector<node>& nodes)
{
    std::vector<node> result;
    result.reserve(nodes.size());

    for (node& n : nodes)
    {
        if (n._kind == node_kind::text)
        {
            sort_marks(n._marks);
        }

        if (!result.empty() && n._kind == node_kind::text &&
            result.back()._kind == node_kind::text &&
            result.back()._marks == n._marks &&
            result.back()._attrs == n._attrs)
        {
            result.back()._text += n._text;
            continue;
        }

        result.push_back(std::move(n));
    }

    nodes = std::move(result);
}

} // namespace

class parser_pass
{
private:
    std::ostream& _err_stream;
    const parser::config& _cfg;
    std::vector<diagnostic> _diagnostics;
    std::size_t _depth{0};

    class depth_guard
    {
    private:
        std::size_t& _depth;

    public:
        [[nodiscard]] explicit depth_guard(std::size_t& depth) : _depth{depth}
        {
            ++_depth;
        }

        ~depth_guard()
        {
            --_depth;
        }

        depth_guard(const depth_guard&) = delete;
        depth_guard& operator=(const depth_guard&) = delete;
    };

    void report(diagnostic d)
    {
        _err_stream << d;
        _diagnostics.push_back(std::move(d));
    }

    void report(const diagnostic_kind kind, const std::size_t line,
        std::string message)
    {
        report(diagnostic{
            ._kind = kind, ._line = line, ._message = std::move(message)});
    }

    void report_warnings(decode_warnings& warnings, const std::size_t line)
    {
        for (std::string& w : warnings)
        {
            report(diagnostic_kind::attribute_decode_error, line, std::move(w));
        }

        warnings.clear();
    }

    void report_unmatched(const marker& m, const std::size_t line)
    {
        const std::string kind = "'" + m._tag._kind + "'";

        report(diagnostic_kind::grammar_mismatch, line,
            m._type == marker::type::open
                ? "open marker of " + kind + " has no matching close marker"
                : "close marker of " + kind + " has no matching open marker");
    }

    //
    // Blocks
    // ------------------------------------------------------------------------

    [[nodiscard]] std::vector<node> parse_blocks(const line_list& lines)
    {
        std::vector<node> result;
        std::size_t i = 0;

        const depth_guard guard{_depth};

        if (_depth > max_nesting_depth)
        {
            while (i < lines.size() && is_blank(lines[i]._text))
            {
                ++i;
            }

            if (i == lines.size())
            {
                return result;
            }

            report(diagnostic_kind::grammar_mismatch, lines[i]._number,
                "nesting deeper than " + std::to_string(max_nesting_depth) +
                    " levels, kept as text");

            const line_list rest(
                lines.begin() + static_cast<std::ptrdiff_t>(i), lines.end());

            result.push_back(make_node(node_kind::paragraph, {},
                {make_text(join_lines(rest))}));

            return result;
        }

        // Open lines known to have no close line.
        std::unordered_map<std::size_t, std::string> unmatched;

        while (i < lines.size())
        {
            const source_line& line = lines[i];
            const std::string_view text = line._text;

            if (is_blank(text))
            {
                ++i;
                continue;
            }

            decode_warnings scratch;
            if (const std::optional<marker> m =
                    whole_line_marker(text, scratch))
            {
                const auto known = unmatched.find(i);

                if (m->_type == marker::type::open &&
                    (known == unmatched.end() ||
                        known->second != m->_tag._kind))
                {
                    const std::optional<std::size_t> end = find_closing_line(
                        lines, i + 1, m->_tag._kind, unmatched);

                    if (end.has_value())
                    {
                        const line_list inner(
                            lines.begin() + static_cast<std::ptrdiff_t>(i + 1),
                            lines.begin() + static_cast<std::ptrdiff_t>(*end));

                        result.push_back(parse_tagged_block(line, inner));
                        i = *end + 1;
                        continue;
                    }
                }

                report_unmatched(*m, line._number);

                result.push_back(make_node(node_kind::paragraph, {},
                    {make_text(std::string{trim(text)})}));

                ++i;
                continue;
            }

            if (std::optional<element_line> el = match_element_line(text))
            {
                result.push_back(parse_element_line(*el, line._number));
                ++i;
                continue;
            }

            if (fence_length(text).has_value())
            {
                i = parse_code_block(lines, i, result);
                continue;
            }

            if (const std::optional<std::size_t> level = heading_level(text))
            {
                result.push_back(parse_heading(text, *level, line._number));
                ++i;
                continue;
            }

            if (text.starts_with('>'))
            {
                line_list quoted;
                for (; i < lines.size() && lines[i]._text.starts_with('>'); ++i)
                {
                    quoted.push_back(source_line{
                        ._text = dequote(lines[i]._text),
                        ._number = lines[i]._number});
                }

                result.push_back(make_node(
                    node_kind::blockquote, {}, parse_blocks(quoted)));

                continue;
            }

            if (is_rule(text))
            {
                result.push_back(make_node(node_kind::rule));
                ++i;
                continue;
            }

            if (match_list_marker(text).has_value())
            {
                i = parse_list(lines, i, result);
                continue;
            }

            line_list paragraph{line};
            for (++i; i < lines.size() && !is_blank(lines[i]._text) &&
                      !is_block_start(lines[i]._text);
                 ++i)
            {
                paragraph.push_back(lines[i]);
            }

            result.push_back(make_node(node_kind::paragraph, {},
                parse_inlines(join_lines(paragraph), line._number)));
        }

        return result;
    }

    // Index of the line closing a multi-line wrapper of `kind`. Same-kind
    // wrappers nest, and lines inside fenced code are ignored. On failure,
    // the later open lines of `kind` that cannot be closed either are added
    // to `unmatched`.
    [[nodiscard]] std::optional<std::size_t> find_closing_line(
        const line_list& lines, const std::size_t from,
        const std::string_view kind,
        std::unordered_map<std::size_t, std::string>& unmatched)
    {
        std::vector<std::pair<std::size_t, std::size_t>> opens;
        std::vector<std::size_t> close_depths;
        std::size_t depth = 1;
        std::optional<std::size_t> fence;

        for (std::size_t j = from; j < lines.size(); ++j)
        {
            const std::string_view text = lines[j]._text;

            if (fence.has_value())
            {
                if (is_fence_close(text, *fence))
                {
                    fence.reset();
                }

                continue;
            }

            if ((fence = fence_length(text)).has_value())
            {
                continue;
            }

            decode_warnings scratch;
            const std::optional<marker> m = whole_line_marker(text, scratch);

            if (!m.has_value() || m->_tag._kind != kind)
            {
                continue;
            }

            if (m->_type == marker::type::open)
            {
                opens.emplace_back(j, ++depth);
                close_depths.push_back(0);
            }
            else if (--depth == 0)
            {
                return j;
            }
            else
            {
                close_depths.push_back(depth);
            }
        }

        // Closes seen after the open at index `k` of `opens`.
        std::size_t lowest = std::numeric_limits<std::size_t>::max();
        std::size_t k = opens.size();

        for (auto it = close_depths.rbegin(); it != close_depths.rend(); ++it)
        {
            if (*it != 0)
            {
                lowest = std::min(lowest, *it);
                continue;
            }

            const auto& [line, open_depth] = opens[--k];
            if (lowest >= open_depth)
            {
                unmatched.try_emplace(line, kind);
            }
        }

        return std::nullopt;
    }

    [[nodiscard]] node parse_tagged_block(
        const source_line& open_line, line_list inner)
    {
        decode_warnings warnings;
        std::optional<marker> m =
            whole_line_marker(open_line._text, warnings);

        const tag& t = m->_tag;
        const std::optional<node_kind> kind = node_kind_from_string(t._kind);

        attributes attrs = read_attributes(
            t, kind.value_or(node_kind::unknown), warnings);

        report_warnings(warnings, open_line._number);

        if (!kind.has_value())
        {
            return make_node(t._kind, std::move(attrs), parse_blocks(inner));
        }

        switch (*kind)
        {
            case node_kind::table:
                return make_node(
                    node_kind::table, std::move(attrs), parse_table(inner));

            case node_kind::panel:
            {
                for (source_line& l : inner)
                {
                    l._text = dequote(l._text);
                }

                if (t.find("panelType") != nullptr)
                {
                    drop_label(inner);
                }

                return make_node(
                    node_kind::panel, std::move(attrs), parse_blocks(inner));
            }

            case node_kind::expand:
            case node_kind::nested_expand:
            {
                if (t.find("title") != nullptr)
                {
                    drop_label(inner);
                }

                return make_node(*kind, std::move(attrs), parse_blocks(inner));
            }

            // Native syntax wrapped only to carry extra attributes.
            case node_kind::paragraph:
            case node_kind::heading:
            case node_kind::blockquote:
            case node_kind::code_block:
            case node_kind::bullet_list:
            case node_kind::ordered_list:
            case node_kind::rule:
            {
                std::vector<node> blocks = parse_blocks(inner);

                if (blocks.size() == 1 && blocks.front()._kind == *kind)
                {
                    node result = std::move(blocks.front());
                    result._attrs = std::move(attrs);
                    return result;
                }

                return make_node(*kind, std::move(attrs), std::move(blocks));
            }

            default:
                return make_node(*kind, std::move(attrs), parse_blocks(inner));
        }
    }

    [[nodiscard]] node parse_element_line(
        element_line& el, const std::size_t line)
    {
        report_warnings(el._warnings, line);

        decode_warnings warnings;
        const std::optional<node_kind> kind =
            node_kind_from_string(el._tag._kind);

        attributes attrs = read_attributes(
            el._tag, kind.value_or(node_kind::unknown), warnings);

        report_warnings(warnings, line);

        if (kind == node_kind::media)
        {
            return make_node(node_kind::media, std::move(attrs));
        }

        return make_node(el._tag._kind, std::move(attrs),
            parse_inlines(decode_single_line(el._body), line));
    }

    [[nodiscard]] std::size_t parse_code_block(
        const line_list& lines, std::size_t i, std::vector<node>& out)
    {
        const std::string_view open = trim_left(lines[i]._text);
        const std::size_t n = *fence_length(open);
        const std::string_view info = trim(open.substr(n));

        node block = make_node(node_kind::code_block);
        if (!info.empty())
        {
            block._attrs.set("language", std::string{info});
        }

        line_list code;
        for (++i; i < lines.size(); ++i)
        {
            if (is_fence_close(lines[i]._text, n))
            {
                ++i;
                break;
            }

            code.push_back(lines[i]);
        }

        if (!code.empty())
        {
            block._content.push_back(make_text(join_lines(code)));
        }

        out.push_back(std::move(block));
        return i;
    }

    [[nodiscard]] node parse_heading(const std::string_view text,
        const std::size_t level, const std::size_t line)
    {
        std::string_view rest = text.substr(level);
        if (!rest.empty())
        {
            rest.remove_prefix(1);
        }

        return make_node(node_kind::heading,
            {{"level", static_cast<std::int64_t>(level)}},
            parse_inlines(decode_single_line(rest), line));
    }

    [[nodiscard]] std::size_t parse_list(
        const line_list& lines, std::size_t i, std::vector<node>& out)
    {
        const list_marker first = *match_list_marker(lines[i]._text);

        node list = make_node(
            first._ordered ? node_kind::ordered_list : node_kind::bullet_list);

        if (first._ordered && first._number != 1)
        {
            list._attrs.set("order", first._number);
        }

        while (i < lines.size())
        {
            const std::optional<list_marker> m =
                match_list_marker(lines[i]._text);

            if (!m.has_value() || m->_ordered != first._ordered)
            {
                break;
            }

            line_list item{
                source_line{._text = m->_rest, ._number = lines[i]._number}};

            const std::string indent(m->_width, ' ');

            for (++i; i < lines.size();)
            {
                const std::string_view text = lines[i]._text;

                if (text.starts_with(indent))
                {
                    item.push_back(
                        source_line{._text = text.substr(indent.size()),
                            ._number = lines[i]._number});

                    ++i;
                    continue;
                }

                if (!is_blank(text))
                {
                    break;
                }

                // Blank lines belong to the item only when indented content
                // follows them.
                std::size_t next = i;
                while (next < lines.size() && is_blank(lines[next]._text))
                {
                    ++next;
                }

                if (next == lines.size() ||
                    !lines[next]._text.starts_with(indent))
                {
                    break;
                }

                for (; i < next; ++i)
                {
                    item.push_back(source_line{._text = std::string_view{},
                        ._number = lines[i]._number});
                }
            }

            list._content.push_back(parse_list_item(std::move(item)));
        }

        out.push_back(std::move(list));
        return i;
    }

    [[nodiscard]] node parse_list_item(line_list lines)
    {
        node item = make_node(node_kind::list_item);
        std::string_view& first = lines.front()._text;

        decode_warnings warnings;
        const std::optional<marker> open = match_marker(first, 0, warnings);

        if (open.has_value() && open->_type == marker::type::open &&
            open->_tag._kind == "listItem")
        {
            decode_warnings scratch;
            const std::optional<marker> close =
                match_marker(first, open->_length, scratch);

            if (close.has_value() && close->_type == marker::type::close &&
                close->_tag._kind == "listItem")
            {
                item._attrs = read_attributes(
                    open->_tag, node_kind::list_item, warnings);

                report_warnings(warnings, lines.front()._number);
                first.remove_prefix(open->_length + close->_length);
            }
        }

        item._content = parse_blocks(lines);
        return item;
    }

    [[nodiscard]] std::vector<node> parse_table(const line_list& inner)
    {
        std::vector<table_line> rows;
        rows.reserve(inner.size());

        for (const source_line& l : inner)
        {
            rows.push_back(table_line{._text = l._text, ._number = l._number});
        }

        return read_table_rows(
            rows,
            [this](const std::string_view slot, const std::size_t row,
                const std::size_t line) { return parse_cell(slot, row, line); },
            [this](diagnostic d) { report(std::move(d)); });
    }

    [[nodiscard]] node parse_cell(const std::string_view slot,
        const std::size_t row, const std::size_t line)
    {
        decode_warnings warnings;
        std::optional<marker> open = match_marker(slot, 0, warnings);

        if (open.has_value() && open->_type == marker::type::open &&
            (open->_tag._kind == "tableCell" ||
                open->_tag._kind == "tableHeader"))
        {
            const std::optional<element_end> end =
                find_element_end(slot, open->_length, open->_tag._kind);

            if (end.has_value() && end->_close_end == slot.size())
            {
                const node_kind kind = open->_tag._kind == "tableCell"
                                           ? node_kind::table_cell
                                           : node_kind::table_header;

                attributes attrs = read_attributes(open->_tag, kind, warnings);
                report_warnings(warnings, line);

                return make_node(kind, std::move(attrs),
                    parse_cell_blocks(
                        slot.substr(open->_length,
                            end->_body_end - open->_length),
                        line));
            }
        }

        return make_node(
            row == 0 ? node_kind::table_header : node_kind::table_cell, {},
            parse_cell_blocks(slot, line));
    }

    [[nodiscard]] std::vector<node> parse_cell_blocks(
        const std::string_view body, const std::size_t line)
    {
        const std::string decoded = decode_single_line(body);
        return parse_blocks(split_lines(decoded, line, false));
    }

    //
    // Inlines
    // ------------------------------------------------------------------------

    [[nodiscard]] std::vector<node> parse_inlines(
        const std::string_view content, const std::size_t first_line)
    {
        std::vector<node> result;
        scan_inlines(content, {}, true, first_line, result);
        normalize_inlines(result);
        return result;
    }

    // `content_level` is set for whole inline sequences, where trailing
    // break syntax at the very end still denotes a hardBreak.
    void scan_inlines(const std::string_view s, const std::vector<mark>& active,
        const bool content_level, const std::size_t first_line,
        std::vector<node>& out)
    {
        const depth_guard guard{_depth};

        if (_depth > max_nesting_depth)
        {
            if (!s.empty())
            {
                report(diagnostic_kind::grammar_mismatch, first_line,
                    "nesting deeper than " +
                        std::to_string(max_nesting_depth) +
                        " levels, kept as text");

                out.push_back(make_text(std::string{s}, active));
            }

            return;
        }

        std::string buf;
        std::size_t raw_spaces = 0;

        const auto flush = [&]
        {
            if (!buf.empty())
            {
                out.push_back(make_text(std::move(buf), active));
                buf.clear();
            }

            raw_spaces = 0;
        };

        const auto push_break = [&]
        {
            flush();
            out.push_back(make_node(node_kind::hard_break));
        };

        const auto append = [&](const char c, const bool raw_space)
        {
            buf += c;
            raw_spaces = raw_space ? raw_spaces + 1 : 0;
        };

        const auto append_literal = [&](const std::string_view chunk)
        {
            buf += chunk;
            raw_spaces = 0;
        };

        line_counter lines{s, first_line};

        // Opens known to have no close, and per backtick run length the
        // first position after which that run never recurs.
        std::unordered_map<std::size_t, std::string> unmatched;
        std::unordered_map<std::size_t, std::size_t> missing_code_close;

        const auto is_known_unmatched =
            [&](const std::size_t body_start, const std::string_view kind)
        {
            const auto it = unmatched.find(body_start);
            return it != unmatched.end() && it->second == kind;
        };

        std::size_t pos = 0;

        while (pos < s.size())
        {
            const char c = s[pos];

            if (c == '\\')
            {
                if (pos + 1 == s.size())
                {
                    if (content_level)
                    {
                        push_break();
                    }
                    else
                    {
                        append(c, false);
                    }

                    ++pos;
                }
                else if (s[pos + 1] == '\n')
                {
                    push_break();
                    pos += 2;
                }
                else if (is_ascii_punct(s[pos + 1]))
                {
                    append(s[pos + 1], false);
                    pos += 2;
                }
                else
                {
                    append(c, false);
                    ++pos;
                }

                continue;
            }

            if (c == '\n')
            {
                if (raw_spaces >= 2)
                {
                    buf.resize(buf.size() - 2);
                    push_break();
                }
                else
                {
                    append(c, false);
                }

                ++pos;
                continue;
            }

            if (c == '&')
            {
                char decoded{};
                const std::size_t n = match_entity(s, pos, decoded);

                append(n > 0 ? decoded : c, false);
                pos += n > 0 ? n : 1;
                continue;
            }

            if (c == '`')
            {
                const std::size_t n = run_length(s, pos, '`');
                const auto missing = missing_code_close.find(n);

                const std::optional<std::size_t> close =
                    missing != missing_code_close.end() &&
                            pos + n >= missing->second
                        ? std::nullopt
                        : find_code_close(s, pos + n, n);

                if (!close.has_value())
                {
                    missing_code_close.try_emplace(n, pos + n);
                    append_literal(s.substr(pos, n));
                    pos += n;
                    continue;
                }

                std::string_view code = s.substr(pos + n, *close - pos - n);
                if (code.size() >= 2 && code.front() == ' ' &&
                    code.back() == ' ' &&
                    code.find_first_not_of(' ') != std::string_view::npos)
                {
                    code = code.substr(1, code.size() - 2);
                }

                flush();

                std::vector<mark> marks = active;
                marks.push_back(make_mark(mark_kind::code));
                out.push_back(make_text(std::string{code}, std::move(marks)));

                pos = *close + n;
                continue;
            }

            if (c == '*' || (c == '~' && s.substr(pos, 2) == "~~"))
            {
                const std::size_t run = run_length(s, pos, c);
                const std::size_t n =
                    c == '~' ? 2 : std::min<std::size_t>(run, 3);

                const std::optional<std::size_t> close =
                    find_delimiter(s, pos + n, c, n);

                if (!close.has_value() || *close == pos + n)
                {
                    append_literal(s.substr(pos, run));
                    pos += run;
                    continue;
                }

                flush();

                std::vector<mark> marks = active;
                if (c == '~')
                {
                    marks.push_back(make_mark(mark_kind::strike));
                }
                else
                {
                    if (n != 2)
                    {
                        marks.push_back(make_mark(mark_kind::em));
                    }

                    if (n >= 2)
                    {
                        marks.push_back(make_mark(mark_kind::strong));
                    }
                }

                scan_inlines(s.substr(pos + n, *close - pos - n), marks, false,
                    lines.at(pos), out);

                pos = *close + n;
                continue;
            }

            if (c == '[')
            {
                std::optional<link_match> link = match_link(s, pos);

                if (!link.has_value())
                {
                    append(c, false);
                    ++pos;
                    continue;
                }

                flush();
                scan_link(*link, active, lines.at(pos), out);

                pos = link->_end;
                continue;
            }

            if (c == '<' && s.substr(pos, 4) == "<!--")
            {
                decode_warnings warnings;
                std::optional<marker> m = match_marker(s, pos, warnings);

                if (!m.has_value())
                {
                    append(c, false);
                    ++pos;
                    continue;
                }

                const std::size_t line = lines.at(pos);
                const std::size_t body_start = pos + m->_length;

                const std::optional<element_end> end =
                    m->_type == marker::type::open &&
                            !is_known_unmatched(body_start, m->_tag._kind)
                        ? find_element_end(
                              s, body_start, m->_tag._kind, &unmatched)
                        : std::nullopt;

                if (!end.has_value())
                {
                    report_unmatched(*m, line);
                    append_literal(s.substr(pos, m->_length));
                    pos = body_start;
                    continue;
                }

                report_warnings(warnings, line);
                flush();

                build_inline_element(m->_tag,
                    s.substr(body_start, end->_body_end - body_start), active,
                    line, out);

                pos = end->_close_end;
                continue;
            }

            append(c, c == ' ');
            ++pos;
        }

        if (content_level && raw_spaces >= 2)
        {
            buf.resize(buf.size() - 2);
            push_break();
        }

        flush();
    }

    void scan_link(const link_match& link, const std::vector<mark>& active,
        const std::size_t line, std::vector<node>& out)
    {
        if (_cfg.infer_inline_cards && !link._angle && active.empty())
        {
            const std::optional<std::string> label = plain_label(link._label);

            if (label.has_value() && *label == link._href)
            {
                out.push_back(make_node(
                    node_kind::inline_card, {{"url", link._href}}));

                return;
            }
        }

        std::vector<mark> marks = active;
        marks.push_back(make_mark(mark_kind::link, {{"href", link._href}}));

        scan_inlines(link._label, marks, false, line, out);
    }

    void build_inline_element(const tag& t, const std::string_view body,
        const std::vector<mark>& active, const std::size_t line,
        std::vector<node>& out)
    {
        decode_warnings warnings;
        const std::optional<node_kind> kind = node_kind_from_string(t._kind);

        if (!kind.has_value())
        {
            node n = make_node(
                t._kind, read_attributes(t, node_kind::unknown, warnings));

            report_warnings(warnings, line);

            scan_inlines(body, {}, true, line, n._content);
            normalize_inlines(n._content);
            out.push_back(std::move(n));
            return;
        }

        if (*kind == node_kind::text)
        {
            std::vector<mark> marks = active;
            tag rest{t._kind, {}};

            for (const tag_attribute& a : t._attributes)
            {
                if (a._name != "marks")
                {
                    rest._attributes.push_back(a);
                    continue;
                }

                for (mark& m : decode_marks(a._raw, warnings))
                {
                    marks.push_back(std::move(m));
                }
            }

            const attributes attrs =
                read_attributes(rest, node_kind::text, warnings);

            report_warnings(warnings, line);

            std::vector<node> inner;
            scan_inlines(body, marks, false, line, inner);

            for (node& n : inner)
            {
                if (n._kind != node_kind::text)
                {
                    out.push_back(std::move(n));
                    continue;
                }

                for (const auto& [name, value] : attrs)
                {
                    n._attrs.set(name, value);
                }

                out.push_back(std::move(n));
            }

            return;
        }

        attributes attrs = read_attributes(t, *kind, warnings);
        report_warnings(warnings, line);

        // Atoms are rebuilt from their attributes; the body is display text.
        if (is_leaf_kind(*kind))
        {
            out.push_back(make_node(*kind, std::move(attrs)));
            return;
        }

        node n = make_node(*kind, std::move(attrs));
        scan_inlines(body, {}, true, line, n._content);
        normalize_inlines(n._content);
        out.push_back(std::move(n));
    }

public:
    [[nodiscard]] explicit parser_pass(
        std::ostream& err_stream, const parser::config& cfg)
        : _err_stream{err_stream}, _cfg{cfg}
    {}

    [[nodiscard]] parse_result parse(const std::string_view source)
    {
        std::vector<node> blocks = parse_blocks(split_lines(source, 1, true));

        node document =
            blocks.size() == 1 && blocks.front()._kind == node_kind::doc
                ? std::move(blocks.front())
                : make_node(node_kind::doc, {}, std::move(blocks));

        return parse_result{._document = std::move(document),
            ._diagnostics = std::move(_diagnostics)};
    }
};

parser::parser(std::ostream& err_stream) : _err_stream{err_stream}
{}

parse_result parser::parse(
    const config& cfg, const std::string_view source) noexcept
{
    parser_pass pass{_err_stream, cfg};
    return pass.parse(source);
}

} // namespace adfmd
