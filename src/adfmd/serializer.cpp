#include "serializer.hpp"

#include "annotation.hpp"
#include "diagnostics.hpp"
#include "document.hpp"
#include "table_transformer.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include <cassert>
#include <cctype>
#include <cstddef>
#include <cstdint>

namespace adfmd {

namespace {

[[nodiscard]] bool is_digit(const char c) noexcept
{
    return c >= '0' && c <= '9';
}

[[nodiscard]] bool contains(
    const std::string_view s, const std::string_view needle) noexcept
{
    return s.find(needle) != std::string_view::npos;
}

// Escapes a text payload so the inline scanner reads it back verbatim.
[[nodiscard]] std::string escape_text(const std::string_view payload,
    const bool at_line_start, const bool at_line_end)
{
    std::string result;
    result.reserve(payload.size());

    for (std::size_t i = 0; i < payload.size(); ++i)
    {
        const char c = payload[i];

        switch (c)
        {
            case '\\':
            case '*':
            case '`':
            case '~':
            case '[':
            case ']':
            case '<':
                result += '\\';
                result += c;
                break;

            case '&':
                result += i + 1 < payload.size() && payload[i + 1] == '#'
                              ? "\\&"
                              : "&";
                break;

            case '\n': result += "&#10;"; break;
            case '\r': result += "&#13;"; break;

            case ' ':
                result += (i == 0 && at_line_start) ||
                                  (i + 1 == payload.size() && at_line_end)
                              ? "&#32;"
                              : " ";
                break;

            default: result += c; break;
        }
    }

    if (!at_line_start || payload.empty())
    {
        return result;
    }

    // Block starters. The characters involved are never escaped above, so
    // payload and result indices still agree at the line start.
    const char first = payload.front();
    if (first == '#' || first == '-' || first == '+' || first == '>')
    {
        result.insert(0, 1, '\\');
        return result;
    }

    std::size_t n_digits = 0;
    while (n_digits < payload.size() && is_digit(payload[n_digits]))
    {
        ++n_digits;
    }

    if (n_digits > 0 && n_digits < payload.size() &&
        (payload[n_digits] == '.' || payload[n_digits] == ')'))
    {
        result.insert(n_digits, 1, '\\');
    }

    return result;
}

[[nodiscard]] std::size_t longest_run(
    const std::string_view s, const char c) noexcept
{
    std::size_t best = 0;
    std::size_t current = 0;

    for (const char x : s)
    {
        current = x == c ? current + 1 : 0;
        best = std::max(best, current);
    }

    return best;
}

[[nodiscard]] bool fits_code_span(const std::string_view payload) noexcept
{
    return !payload.empty() &&
           payload.find_first_of("\n\r|") == std::string_view::npos &&
           !contains(payload, "<br/>") && !contains(payload, "<!--");
}

[[nodiscard]] std::string code_span(const std::string_view payload)
{
    const std::string fence(longest_run(payload, '`') + 1, '`');

    const bool pad = payload.front() == '`' || payload.back() == '`' ||
                     (payload.front() == ' ' && payload.back() == ' ' &&
                         payload.find_first_not_of(' ') !=
                             std::string_view::npos);

    std::string result = fence;
    if (pad)
    {
        result += ' ';
    }

    result += payload;

    if (pad)
    {
        result += ' ';
    }

    result += fence;
    return result;
}

[[nodiscard]] bool needs_angle_brackets(const std::string_view href) noexcept
{
    return href.empty() ||
           href.find_first_of(" \t()<>\\`&\n\r") != std::string_view::npos;
}

[[nodiscard]] std::string link_destination(
    const std::string_view href, const bool force_angle_brackets)
{
    if (!force_angle_brackets && !needs_angle_brackets(href))
    {
        return std::string{href};
    }

    std::string result = "<";

    for (std::size_t i = 0; i < href.size(); ++i)
    {
        const char c = href[i];

        if (c == '<' || c == '>' || c == '\\' || c == '`')
        {
            result += '\\';
            result += c;
        }
        else if (c == '&' && i + 1 < href.size() && href[i + 1] == '#')
        {
            result += "\\&";
        }
        else if (c == '\n')
        {
            result += "&#10;";
        }
        else if (c == '\r')
        {
            result += "&#13;";
        }
        else
        {
            result += c;
        }
    }

    result += '>';
    return result;
}

// Human-readable spelling of an attribute value for fallback bodies.
[[nodiscard]] std::string display_text(const attr_value& value)
{
    if (const auto* s = std::get_if<std::string>(&value))
    {
        return *s;
    }

    return encode_attribute("", value, std::nullopt)._raw;
}

[[nodiscard]] std::string display_attribute(
    const node& n, const std::string_view name)
{
    const attr_value* value = n._attrs.find(name);
    return value == nullptr ? std::string{} : display_text(*value);
}

// ISO-8601 UTC spelling of a millisecond epoch timestamp.
[[nodiscard]] std::optional<std::string> format_timestamp(
    const std::string_view millis)
{
    std::int64_t ms{};
    const auto [ptr, ec] =
        std::from_chars(millis.data(), millis.data() + millis.size(), ms);

    if (ec != std::errc{} || ptr != millis.data() + millis.size())
    {
        return std::nullopt;
    }

    // 0000-01-01T00:00:00Z to 9999-12-31T23:59:59.999Z.
    constexpr std::int64_t min_ms = -62167219200000;
    constexpr std::int64_t max_ms = 253402300799999;

    if (ms < min_ms || ms > max_ms)
    {
        return std::nullopt;
    }

    using namespace std::chrono;

    const sys_time<milliseconds> tp{milliseconds{ms}};
    const sys_days day = floor<days>(tp);
    const year_month_day ymd{day};
    const hh_mm_ss hms{floor<seconds>(tp - day)};

    if (!ymd.ok())
    {
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year())
        << '-' << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
        << std::setw(2) << hms.hours().count() << ':' << std::setw(2)
        << hms.minutes().count() << ':' << std::setw(2)
        << hms.seconds().count() << 'Z';

    return oss.str();
}

[[nodiscard]] std::string media_body(const node& n)
{
    const std::string file = "fileId:" + display_attribute(n, "id");

    return "[" + escape_text(display_attribute(n, "alt"), false, false) +
           "](" + link_destination(file, false) + ")";
}

[[nodiscard]] std::string prefix_lines(const std::string_view text,
    const std::string_view prefix, const std::string_view blank_prefix)
{
    std::string result;
    std::size_t start = 0;

    while (true)
    {
        const std::size_t end = text.find('\n', start);
        const std::string_view line = text.substr(start, end - start);

        result += line.empty() ? blank_prefix : prefix;
        result += line;

        if (end == std::string_view::npos)
        {
            break;
        }

        result += '\n';
        start = end + 1;
    }

    return result;
}

// First line follows the list marker, the rest are indented by its width.
[[nodiscard]] std::string indent_item(
    const std::string_view marker, const std::string_view body)
{
    std::string result{marker};

    if (body.empty())
    {
        return result;
    }

    const std::string indent(marker.size() + 1, ' ');
    const std::size_t first_end = body.find('\n');

    result += ' ';
    result += body.substr(0, first_end);

    if (first_end != std::string_view::npos)
    {
        result += '\n';
        result += prefix_lines(body.substr(first_end + 1), indent, "");
    }

    return result;
}

[[nodiscard]] bool is_list_kind(const node_kind kind) noexcept
{
    return kind == node_kind::bullet_list || kind == node_kind::ordered_list;
}

} // namespace

class serializer_pass
{
private:
    std::ostream& _err_stream;
    const serializer::config& _cfg;
    std::vector<std::size_t> _path;
    std::optional<structural_violation> _violation;

    class path_guard
    {
    private:
        std::vector<std::size_t>& _path;

    public:
        [[nodiscard]] explicit path_guard(
            std::vector<std::size_t>& path, const std::size_t index)
            : _path{path}
        {
            _path.push_back(index);
        }

        ~path_guard()
        {
            _path.pop_back();
        }

        path_guard(const path_guard&) = delete;
        path_guard& operator=(const path_guard&) = delete;
    };

    [[nodiscard]] std::string current_path() const
    {
        std::string result;

        for (const std::size_t index : _path)
        {
            result += "/content/";
            result += std::to_string(index);
        }

        return result;
    }

    [[nodiscard]] bool fail(std::string reason)
    {
        _violation = structural_violation{
            ._path = current_path(), ._reason = std::move(reason)};

        _err_stream << *_violation;
        return false;
    }

    [[nodiscard]] bool fail_kind(const node& n, const std::string_view context)
    {
        return fail("'" + std::string{type_name(n)} + "' is not allowed " +
                    std::string{context});
    }

    void wrap_block(
        const node& n, const std::string_view body, std::string& out)
    {
        if (!_cfg.emit_annotations)
        {
            out += body;
            return;
        }

        out += open_marker(make_tag(n));
        out += '\n';

        if (!body.empty())
        {
            out += body;
            out += '\n';
        }

        out += close_marker(type_name(n));
    }

    void wrap_inline(
        const node& n, const std::string_view body, std::string& out)
    {
        if (!_cfg.emit_annotations)
        {
            out += body;
            return;
        }

        out += open_marker(make_tag(n));
        out += body;
        out += close_marker(type_name(n));
    }

    //
    // Blocks
    // ------------------------------------------------------------------------

    [[nodiscard]] bool render_blocks(const std::vector<node>& children,
        std::string& out, const bool in_list_item)
    {
        for (std::size_t i = 0; i < children.size(); ++i)
        {
            const path_guard guard{_path, i};
            const node& child = children[i];

            if (is_inline_kind(child._kind))
            {
                return fail_kind(child, "in block context");
            }

            if (i > 0)
            {
                const bool nested_list = in_list_item &&
                                         is_list_kind(child._kind) &&
                                         children[i - 1]._kind ==
                                             node_kind::paragraph;

                out += nested_list ? "\n" : "\n\n";
            }

            if (!render_block(child, out))
            {
                return false;
            }
        }

        return true;
    }

    [[nodiscard]] bool check_depth()
    {
        if (_path.size() > max_nesting_depth)
        {
            return fail("nesting deeper than " +
                        std::to_string(max_nesting_depth) + " levels");
        }

        return true;
    }

    [[nodiscard]] bool render_block(const node& n, std::string& out)
    {
        if (!check_depth())
        {
            return false;
        }

        if (is_leaf_kind(n._kind) && !n._content.empty())
        {
            return fail("'" + std::string{type_name(n)} +
                        "' cannot have content");
        }

        switch (n._kind)
        {
            case node_kind::doc: return fail("'doc' is only allowed as root");

            case node_kind::paragraph: return render_paragraph(n, out);
            case node_kind::heading: return render_heading(n, out);
            case node_kind::blockquote: return render_blockquote(n, out);
            case node_kind::code_block: return render_code_block(n, out);

            case node_kind::bullet_list:
            case node_kind::ordered_list: return render_list(n, out);

            case node_kind::rule:
            {
                if (n._attrs.empty())
                {
                    out += "---";
                }
                else
                {
                    wrap_block(n, "---", out);
                }

                return true;
            }

            case node_kind::table: return render_table(n, out);
            case node_kind::panel: return render_panel(n, out);

            case node_kind::expand:
            case node_kind::nested_expand: return render_expand(n, out);

            case node_kind::media_single:
            case node_kind::media_group: return render_media_container(n, out);

            case node_kind::media:
                wrap_inline(n, media_body(n), out);
                return true;

            case node_kind::caption: return render_element_line(n, out);
            case node_kind::unknown: return render_unknown_block(n, out);

            case node_kind::list_item: return fail_kind(n, "outside a list");

            case node_kind::table_row:
            case node_kind::table_cell:
            case node_kind::table_header:
                return fail_kind(n, "outside a table");

            case node_kind::text:
            case node_kind::hard_break:
            case node_kind::inline_card:
            case node_kind::date:
            case node_kind::status:
            case node_kind::mention:
            case node_kind::emoji:
            case node_kind::media_inline:
                return fail_kind(n, "in block context");
        }

        assert(false);
        return false;
    }

    [[nodiscard]] bool render_paragraph(const node& n, std::string& out)
    {
        // A lone unknown element would read back as a block of its own.
        if (n._content.size() == 1 && n._content[0]._kind == node_kind::unknown)
        {
            std::string body;

            {
                const path_guard guard{_path, 0};
                if (!render_element_line(n._content[0], body))
                {
                    return false;
                }
            }

            wrap_block(n, body, out);
            return true;
        }

        std::string body;
        if (!render_inlines(n._content, body))
        {
            return false;
        }

        if (!n._attrs.empty() || n._content.empty())
        {
            wrap_block(n, body, out);
            return true;
        }

        out += body;
        return true;
    }

    [[nodiscard]] bool render_heading(const node& n, std::string& out)
    {
        const std::optional<std::int64_t> level =
            get_integer(n._attrs, "level");

        if (!level.has_value() || *level < 1 || *level > 6)
        {
            return fail("heading level must be an integer between 1 and 6");
        }

        std::string body;
        if (!render_inlines(n._content, body))
        {
            return false;
        }

        std::string line(static_cast<std::size_t>(*level), '#');
        if (!body.empty())
        {
            line += ' ';
            line += encode_single_line(body);
        }

        if (n._attrs.size() == 1)
        {
            out += line;
        }
        else
        {
            wrap_block(n, line, out);
        }

        return true;
    }

    [[nodiscard]] bool render_blockquote(const node& n, std::string& out)
    {
        std::string body;
        if (!render_blocks(n._content, body, false))
        {
            return false;
        }

        const std::string quoted =
            body.empty() ? ">" : prefix_lines(body, "> ", ">");

        if (n._attrs.empty())
        {
            out += quoted;
        }
        else
        {
            wrap_block(n, quoted, out);
        }

        return true;
    }

    [[nodiscard]] bool render_code_block(const node& n, std::string& out)
    {
        std::string code;

        for (std::size_t i = 0; i < n._content.size(); ++i)
        {
            const path_guard guard{_path, i};
            const node& child = n._content[i];

            if (child._kind != node_kind::text)
            {
                return fail_kind(child, "in a codeBlock");
            }

            if (!child._marks.empty())
            {
                return fail("codeBlock text cannot carry marks");
            }

            if (!child._content.empty())
            {
                return fail("'text' cannot have content");
            }

            code += child._text;
        }

        // The closing fence must outrun any backtick-only line of the code.
        std::size_t n_fence = 3;
        {
            std::size_t start = 0;
            while (start <= code.size())
            {
                const std::size_t end =
                    std::min(code.find('\n', start), code.size());

                const std::string_view line =
                    std::string_view{code}.substr(start, end - start);

                const std::size_t first = line.find_first_not_of(' ');
                if (first != std::string_view::npos &&
                    line.find_first_not_of("` ") == std::string_view::npos)
                {
                    n_fence = std::max(n_fence, longest_run(line, '`') + 1);
                }

                start = end + 1;
            }
        }

        const std::string fence(n_fence, '`');
        const std::string* language = get_string(n._attrs, "language");

        const bool valid_language =
            language != nullptr && !language->empty() &&
            language->find_first_of(" \t`") == std::string::npos;

        std::string block = fence;
        if (valid_language)
        {
            block += *language;
        }

        block += '\n';

        if (!n._content.empty())
        {
            block += code;
            block += '\n';
        }

        block += fence;

        const bool native =
            n._attrs.empty() || (n._attrs.size() == 1 && valid_language);

        if (native)
        {
            out += block;
        }
        else
        {
            wrap_block(n, block, out);
        }

        return true;
    }

    [[nodiscard]] bool render_list(const node& n, std::string& out)
    {
        const bool bullet = n._kind == node_kind::bullet_list;
        const std::optional<std::int64_t> order =
            get_integer(n._attrs, "order");

        const bool valid_order = order.has_value() && *order >= 0;
        const std::int64_t start = valid_order ? *order : 1;

        const bool native =
            n._attrs.empty() ||
            (!bullet && n._attrs.size() == 1 && valid_order && *order != 1);

        std::string body;

        for (std::size_t i = 0; i < n._content.size(); ++i)
        {
            const path_guard guard{_path, i};
            const node& item = n._content[i];

            if (item._kind != node_kind::list_item)
            {
                return fail_kind(item, "in a list");
            }

            std::string item_body;

            if (!item._attrs.empty() && _cfg.emit_annotations)
            {
                item_body += open_marker(make_tag(item));
                item_body += close_marker("listItem");
            }

            if (!render_blocks(item._content, item_body, true))
            {
                return false;
            }

            const std::string marker =
                bullet ? "-"
                       : std::to_string(start + static_cast<std::int64_t>(i)) +
                             ".";

            if (i > 0)
            {
                body += '\n';
            }

            body += indent_item(marker, item_body);
        }

        if (native)
        {
            out += body;
        }
        else
        {
            wrap_block(n, body, out);
        }

        return true;
    }

    [[nodiscard]] bool render_table(const node& n, std::string& out)
    {
        table_layout layout;

        if (std::optional<table_span_error> error = layout_table(n, layout))
        {
            const path_guard row_guard{_path, error->_row};

            if (error->_cell.has_value())
            {
                const path_guard cell_guard{_path, *error->_cell};
                return fail(std::move(error->_reason));
            }

            return fail(std::move(error->_reason));
        }

        const std::size_t columns = column_count(layout);
        std::string body;

        for (std::size_t r = 0; r < layout.size(); ++r)
        {
            const path_guard row_guard{_path, r};
            const node& row = n._content[r];

            std::vector<std::optional<std::string>> slots;

            for (const node* cell : layout[r])
            {
                if (cell == nullptr)
                {
                    slots.emplace_back(std::nullopt);
                    continue;
                }

                const path_guard cell_guard{_path,
                    static_cast<std::size_t>(cell - row._content.data())};

                std::string rendered;
                if (!render_cell(*cell, rendered))
                {
                    return false;
                }

                slots.emplace_back(std::move(rendered));
            }

            if (r > 0)
            {
                body += '\n';
            }

            body += render_row(slots);

            if (!row._attrs.empty() && _cfg.emit_annotations)
            {
                body += ' ';
                body += open_marker(make_tag(row));
                body += close_marker("tableRow");
            }

            if (r == 0)
            {
                body += '\n';
                body += render_separator(columns);
            }
        }

        wrap_block(n, body, out);
        return true;
    }

    [[nodiscard]] bool render_cell(const node& cell, std::string& out)
    {
        const bool all_inline = std::all_of(cell._content.begin(),
            cell._content.end(),
            [](const node& c) { return is_inline_kind(c._kind); });

        std::string body;

        // Inline content reads back as a single paragraph.
        if (!cell._content.empty() && all_inline)
        {
            if (!render_inlines(cell._content, body))
            {
                return false;
            }
        }
        else if (!render_blocks(cell._content, body, false))
        {
            return false;
        }

        wrap_inline(cell, encode_single_line(body), out);
        return true;
    }

    [[nodiscard]] bool render_panel(const node& n, std::string& out)
    {
        std::string body;
        if (!render_blocks(n._content, body, false))
        {
            return false;
        }

        std::string inner;

        if (const attr_value* type = n._attrs.find("panelType"))
        {
            std::string label = display_text(*type);
            std::transform(label.begin(), label.end(), label.begin(),
                [](const unsigned char c)
                { return static_cast<char>(std::toupper(c)); });

            inner = "**" + escape_text(label, false, false) + "**";

            if (!body.empty())
            {
                inner += "\n\n";
                inner += body;
            }
        }
        else
        {
            inner = std::move(body);
        }

        wrap_block(
            n, inner.empty() ? "" : prefix_lines(inner, "> ", ">"), out);

        return true;
    }

    [[nodiscard]] bool render_expand(const node& n, std::string& out)
    {
        std::string body;
        if (!render_blocks(n._content, body, false))
        {
            return false;
        }

        std::string inner;

        if (const attr_value* title = n._attrs.find("title"))
        {
            inner =
                "**" + escape_text(display_text(*title), false, false) + "**";

            if (!body.empty())
            {
                inner += "\n\n";
                inner += body;
            }
        }
        else
        {
            inner = std::move(body);
        }

        wrap_block(n, inner, out);
        return true;
    }

    [[nodiscard]] bool render_media_container(const node& n, std::string& out)
    {
        const bool single = n._kind == node_kind::media_single;

        for (std::size_t i = 0; i < n._content.size(); ++i)
        {
            const node_kind kind = n._content[i]._kind;

            const bool allowed =
                kind == node_kind::media || kind == node_kind::unknown ||
                (single && kind == node_kind::caption);

            if (!allowed)
            {
                const path_guard guard{_path, i};
                return fail_kind(n._content[i],
                    single ? "in a mediaSingle" : "in a mediaGroup");
            }
        }

        std::string body;
        if (!render_blocks(n._content, body, false))
        {
            return false;
        }

        wrap_block(n, body, out);
        return true;
    }

    // Open marker, single-line encoded inline children, close marker.
    [[nodiscard]] bool render_element_line(const node& n, std::string& out)
    {
        std::string body;
        if (!render_inlines(n._content, body))
        {
            return false;
        }

        wrap_inline(n, encode_single_line(body), out);
        return true;
    }

    [[nodiscard]] bool render_unknown_block(const node& n, std::string& out)
    {
        const std::size_t n_inline = static_cast<std::size_t>(
            std::count_if(n._content.begin(), n._content.end(),
                [](const node& c) { return is_inline_kind(c._kind); }));

        if (n_inline == n._content.size())
        {
            return render_element_line(n, out);
        }

        if (n_inline > 0)
        {
            return fail("'" + std::string{type_name(n)} +
                        "' mixes inline and block children");
        }

        std::string body;
        if (!render_blocks(n._content, body, false))
        {
            return false;
        }

        wrap_block(n, body, out);
        return true;
    }

    //
    // Inlines
    // ------------------------------------------------------------------------

    [[nodiscard]] bool render_inlines(
        const std::vector<node>& children, std::string& out)
    {
        bool line_start = true;

        for (std::size_t i = 0; i < children.size(); ++i)
        {
            const path_guard guard{_path, i};
            const node& child = children[i];

            const bool last = i + 1 == children.size();
            const bool line_end =
                last || (children[i + 1]._kind == node_kind::hard_break &&
                            children[i + 1]._attrs.empty());

            if (!render_inline(child, out, line_start, line_end, last))
            {
                return false;
            }

            line_start =
                child._kind == node_kind::hard_break && child._attrs.empty();
        }

        return true;
    }

    [[nodiscard]] bool render_inline(const node& n, std::string& out,
        const bool line_start, const bool line_end, const bool last)
    {
        if (!check_depth())
        {
            return false;
        }

        if ((is_leaf_kind(n._kind) || n._kind == node_kind::text) &&
            !n._content.empty())
        {
            return fail("'" + std::string{type_name(n)} +
                        "' cannot have content");
        }

        switch (n._kind)
        {
            case node_kind::text:
                return render_text(n, out, line_start, line_end);

            case node_kind::hard_break:
            {
                if (!n._attrs.empty())
                {
                    wrap_inline(n, "", out);
                    return true;
                }

                // A backslash keeps a break at the line start visible.
                out += line_start ? "\\" : "  ";
                if (!last)
                {
                    out += '\n';
                }

                return true;
            }

            case node_kind::inline_card: return render_inline_card(n, out);

            case node_kind::date:
            {
                const std::string timestamp = display_attribute(n, "timestamp");
                const std::optional<std::string> iso =
                    format_timestamp(timestamp);

                wrap_inline(
                    n, escape_text(iso.value_or(timestamp), false, false), out);

                return true;
            }

            case node_kind::status:
                wrap_inline(n,
                    escape_text(display_attribute(n, "text"), false, false),
                    out);

                return true;

            case node_kind::mention:
            {
                std::string body = display_attribute(n, "text");
                if (body.empty())
                {
                    body = "@mention(" + display_attribute(n, "id") + ")";
                }

                wrap_inline(n, escape_text(body, false, false), out);
                return true;
            }

            case node_kind::emoji:
            {
                std::string body = display_attribute(n, "text");
                if (body.empty())
                {
                    body = display_attribute(n, "shortName");
                }

                wrap_inline(n, escape_text(body, false, false), out);
                return true;
            }

            case node_kind::media_inline:
                wrap_inline(n, media_body(n), out);
                return true;

            case node_kind::unknown:
            {
                if (!std::all_of(n._content.begin(), n._content.end(),
                        [](const node& c) { return is_inline_kind(c._kind); }))
                {
                    return fail("'" + std::string{type_name(n)} +
                                "' in inline context holds block content");
                }

                std::string body;
                if (!render_inlines(n._content, body))
                {
                    return false;
                }

                wrap_inline(n, body, out);
                return true;
            }

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
            case node_kind::caption: return fail_kind(n, "in inline context");
        }

        assert(false);
        return false;
    }

    [[nodiscard]] bool render_inline_card(const node& n, std::string& out)
    {
        const std::string* url = get_string(n._attrs, "url");

        if (url != nullptr && n._attrs.size() == 1 && !url->empty() &&
            !needs_angle_brackets(*url))
        {
            out += '[';
            out += escape_text(*url, false, false);
            out += "](";
            out += *url;
            out += ')';
            return true;
        }

        const std::string href = display_attribute(n, "url");
        wrap_inline(n,
            "[" + escape_text(href, false, false) + "](" +
                link_destination(href, true) + ")",
            out);

        return true;
    }

    [[nodiscard]] bool render_text(const node& n, std::string& out,
        const bool line_start, const bool line_end)
    {
        if (n._text.empty())
        {
            return fail("text node with an empty payload");
        }

        bool code = false;
        bool em = false;
        bool strong = false;
        bool strike = false;
        const std::string* href = nullptr;
        std::vector<mark> annotated;

        const auto take = [&](bool& flag, const mark& m)
        {
            if (flag || !m._attrs.empty())
            {
                annotated.push_back(m);
                return;
            }

            flag = true;
        };

        for (const mark& m : n._marks)
        {
            switch (m._kind)
            {
                case mark_kind::code:
                {
                    if (fits_code_span(n._text))
                    {
                        take(code, m);
                    }
                    else
                    {
                        annotated.push_back(m);
                    }

                    break;
                }

                case mark_kind::em: take(em, m); break;
                case mark_kind::strong: take(strong, m); break;
                case mark_kind::strike: take(strike, m); break;

                case mark_kind::link:
                {
                    const std::string* h = get_string(m._attrs, "href");
                    if (href == nullptr && h != nullptr && m._attrs.size() == 1)
                    {
                        href = h;
                    }
                    else
                    {
                        annotated.push_back(m);
                    }

                    break;
                }

                case mark_kind::underline:
                case mark_kind::subsup:
                case mark_kind::text_color:
                case mark_kind::background_color:
                case mark_kind::unknown: annotated.push_back(m); break;
            }
        }

        sort_marks(annotated);

        const bool wrapped =
            _cfg.emit_annotations && (!annotated.empty() || !n._attrs.empty());

        // Only a payload that is not preceded or followed by a delimiter
        // touches the line edges.
        const bool edges =
            !em && !strong && !strike && href == nullptr && !wrapped;

        std::string s = code ? code_span(n._text)
                             : escape_text(n._text, line_start && edges,
                                   line_end && edges);

        if (em)
        {
            s = "*" + s + "*";
        }

        if (strong)
        {
            s = "**" + s + "**";
        }

        if (strike)
        {
            s = "~~" + s + "~~";
        }

        if (href != nullptr)
        {
            // `[x](x)` with a plain label would read back as an inlineCard.
            const bool card_like = !code && !em && !strong && !strike &&
                                   n._text == *href;

            s = "[" + s + "](" + link_destination(*href, card_like) + ")";
        }

        if (!wrapped)
        {
            out += s;
            return true;
        }

        tag t;
        t._kind = "text";

        if (!annotated.empty())
        {
            t._attributes.push_back(
                tag_attribute{"marks", encode_marks(annotated), true});
        }

        for (const auto& [name, value] : n._attrs)
        {
            t._attributes.push_back(encode_attribute(
                name, value, schema_type(node_kind::text, name)));
        }

        out += open_marker(t);
        out += s;
        out += close_marker("text");
        return true;
    }

public:
    [[nodiscard]] explicit serializer_pass(
        std::ostream& err_stream, const serializer::config& cfg)
        : _err_stream{err_stream}, _cfg{cfg}
    {}

    [[nodiscard]] const std::optional<structural_violation>&
    violation() const noexcept
    {
        return _violation;
    }

    [[nodiscard]] bool serialize(const node& root, std::string& out)
    {
        std::string rendered;

        if (root._kind == node_kind::doc)
        {
            std::string body;
            if (!render_blocks(root._content, body, false))
            {
                return false;
            }

            if (root._attrs.empty())
            {
                rendered = std::move(body);
            }
            else
            {
                wrap_block(root, body, rendered);
            }
        }
        else if (is_inline_kind(root._kind))
        {
            if (!render_inline(root, rendered, true, true, true))
            {
                return false;
            }
        }
        else if (!render_block(root, rendered))
        {
            return false;
        }

        if (!rendered.empty())
        {
            out += rendered;
            out += '\n';
        }

        return true;
    }
};

serializer::serializer(std::ostream& err_stream) : _err_stream{err_stream}
{}

std::optional<structural_violation> serializer::serialize(
    const config& cfg, std::string& output_buffer, const node& root) noexcept
{
    serializer_pass pass{_err_stream, cfg};

    if (!pass.serialize(root, output_buffer))
    {
        assert(pass.violation().has_value());
        return pass.violation();
    }

    return std::nullopt;
}

} // namespace adfmd
