#include "table_transformer.hpp"

#include "annotation.hpp"
#include "diagnostics.hpp"
#include "document.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cassert>
#include <cstddef>
#include <cstdint>

namespace adfmd {

namespace {

constexpr std::string_view line_break_tag = "<br/>";

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    {
        s.remove_prefix(1);
    }

    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    {
        s.remove_suffix(1);
    }

    return s;
}

[[nodiscard]] std::size_t preceding_backslashes(
    const std::string_view s, const std::size_t pos) noexcept
{
    std::size_t result = 0;
    while (result < pos && s[pos - result - 1] == '\\')
    {
        ++result;
    }

    return result;
}

[[nodiscard]] bool is_unescaped_pipe(
    const std::string_view s, const std::size_t pos) noexcept
{
    return s[pos] == '|' && preceding_backslashes(s, pos) % 2 == 0;
}

// Missing or malformed spans count as 1; the serializer validates them.
[[nodiscard]] std::size_t read_span(
    const node& cell, const std::string_view name) noexcept
{
    const std::optional<std::int64_t> value = get_integer(cell._attrs, name);
    return value.has_value() && *value > 1 ? static_cast<std::size_t>(*value)
                                           : 1;
}

} // namespace

//
// Single-line encoding
// ----------------------------------------------------------------------------

std::string encode_single_line(const std::string_view text)
{
    std::string result;
    result.reserve(text.size());

    std::size_t run = 0;

    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];

        if (c == '\\')
        {
            result += c;
            ++run;
            continue;
        }

        if (c == '\n')
        {
            result.append(run, '\\');
            result += line_break_tag;
        }
        else if (text.substr(i, line_break_tag.size()) == line_break_tag)
        {
            result.append(run + 1, '\\');
            result += line_break_tag;
            i += line_break_tag.size() - 1;
        }
        else if (c == '|')
        {
            result.append(run + 1, '\\');
            result += c;
        }
        else
        {
            result += c;
        }

        run = 0;
    }

    return result;
}

std::string decode_single_line(const std::string_view text)
{
    std::string result;
    result.reserve(text.size());

    std::size_t run = 0;

    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];

        if (c == '\\')
        {
            result += c;
            ++run;
            continue;
        }

        if (text.substr(i, line_break_tag.size()) == line_break_tag)
        {
            if (run % 2 == 0)
            {
                result.resize(result.size() - run / 2);
                result += '\n';
            }
            else
            {
                result.resize(result.size() - (run + 1) / 2);
                result += line_break_tag;
            }

            i += line_break_tag.size() - 1;
        }
        else if (c == '|' && run % 2 == 1)
        {
            result.resize(result.size() - (run + 1) / 2);
            result += c;
        }
        else
        {
            result += c;
        }

        run = 0;
    }

    return result;
}

//
// Layout
// ----------------------------------------------------------------------------

std::optional<table_span_error> layout_table(
    const node& table, table_layout& layout)
{
    layout.clear();

    const std::size_t n_rows = table._content.size();

    // Rows still covered below the current one, per column.
    std::vector<std::size_t> covered;

    for (std::size_t r = 0; r < n_rows; ++r)
    {
        const node& row = table._content[r];

        if (row._kind != node_kind::table_row)
        {
            return table_span_error{._row = r,
                ._cell = std::nullopt,
                ._reason = "table holds '" + std::string{type_name(row)} +
                           "', expected 'tableRow'"};
        }

        std::vector<std::size_t> next = covered;
        for (std::size_t& c : next)
        {
            c = c > 0 ? c - 1 : 0;
        }

        std::vector<const node*>& slots = layout.emplace_back();
        std::size_t col = 0;

        const auto skip_covered = [&]
        {
            while (col < covered.size() && covered[col] > 0)
            {
                slots.push_back(nullptr);
                ++col;
            }
        };

        for (std::size_t i = 0; i < row._content.size(); ++i)
        {
            const node& cell = row._content[i];

            if (cell._kind != node_kind::table_cell &&
                cell._kind != node_kind::table_header)
            {
                return table_span_error{._row = r,
                    ._cell = i,
                    ._reason = "tableRow holds '" +
                               std::string{type_name(cell)} +
                               "', expected 'tableCell' or 'tableHeader'"};
            }

            for (const std::string_view name : {"colspan", "rowspan"})
            {
                if (!cell._attrs.contains(name))
                {
                    continue;
                }

                const std::optional<std::int64_t> value =
                    get_integer(cell._attrs, name);

                if (!value.has_value() || *value < 1)
                {
                    return table_span_error{._row = r,
                        ._cell = i,
                        ._reason = std::string{name} +
                                   " must be an integer >= 1"};
                }
            }

            const std::size_t colspan = read_span(cell, "colspan");
            const std::size_t rowspan = read_span(cell, "rowspan");

            if (r + rowspan > n_rows)
            {
                return table_span_error{._row = r,
                    ._cell = i,
                    ._reason = "rowspan " + std::to_string(rowspan) +
                               " extends past the last row of the table"};
            }

            skip_covered();

            if (colspan > max_table_columns - std::min(col, max_table_columns))
            {
                return table_span_error{._row = r,
                    ._cell = i,
                    ._reason = "colspan " + std::to_string(colspan) +
                               " makes the table wider than " +
                               std::to_string(max_table_columns) +
                               " columns"};
            }

            for (std::size_t k = col; k < col + colspan; ++k)
            {
                if (k < covered.size() && covered[k] > 0)
                {
                    return table_span_error{._row = r,
                        ._cell = i,
                        ._reason = "cell overlaps a cell spanning from an "
                                   "earlier row"};
                }

                if (next.size() <= k)
                {
                    next.resize(k + 1, 0);
                }

                next[k] = rowspan - 1;
            }

            slots.push_back(&cell);
            slots.insert(slots.end(), colspan - 1, nullptr);
            col += colspan;
        }

        skip_covered();
        covered = std::move(next);
    }

    return std::nullopt;
}

std::size_t column_count(const table_layout& layout) noexcept
{
    std::size_t result = 0;
    for (const std::vector<const node*>& row : layout)
    {
        result = std::max(result, row.size());
    }

    return result;
}

std::string render_row(const std::vector<std::optional<std::string>>& slots)
{
    std::string result = "|";

    for (const std::optional<std::string>& slot : slots)
    {
        if (!slot.has_value())
        {
            result += '|';
            continue;
        }

        result += ' ';
        result += *slot;
        result += " |";
    }

    return result;
}

std::string render_separator(const std::size_t columns)
{
    std::string result = "|";

    for (std::size_t i = 0; i < columns; ++i)
    {
        result += " --- |";
    }

    return result;
}

std::vector<std::string_view> split_row(std::string_view line)
{
    line = trim(line);

    if (!line.empty() && line.front() == '|')
    {
        line.remove_prefix(1);
        if (line.empty())
        {
            return {};
        }
    }

    if (!line.empty() && is_unescaped_pipe(line, line.size() - 1))
    {
        line.remove_suffix(1);
    }

    std::vector<std::string_view> result;
    std::size_t start = 0;

    for (std::size_t i = 0; i < line.size(); ++i)
    {
        if (is_unescaped_pipe(line, i))
        {
            result.push_back(trim(line.substr(start, i - start)));
            start = i + 1;
        }
    }

    result.push_back(trim(line.substr(start)));
    return result;
}

bool is_separator_row(std::string_view line) noexcept
{
    line = trim(line);

    if (line.empty() || line.front() != '|')
    {
        return false;
    }

    line.remove_prefix(1);

    while (!line.empty())
    {
        const std::size_t end = line.find('|');
        if (end == std::string_view::npos)
        {
            return trim(line).empty();
        }

        std::string_view cell = trim(line.substr(0, end));

        if (!cell.empty() && cell.front() == ':')
        {
            cell.remove_prefix(1);
        }

        if (!cell.empty() && cell.back() == ':')
        {
            cell.remove_suffix(1);
        }

        if (cell.empty() || cell.find_first_not_of('-') != std::string::npos)
        {
            return false;
        }

        line.remove_prefix(end + 1);
    }

    return true;
}

//
// Parsing
// ----------------------------------------------------------------------------

void span_context::begin_row(const std::size_t row) noexcept
{
    _row = row;
    _pending_colspan = 0;
}

bool span_context::is_covered(const std::size_t column) const noexcept
{
    if (column >= _columns.size() || !_columns[column].has_value())
    {
        return false;
    }

    const column_span& span = *_columns[column];
    return span._origin_row < _row && span._last_row >= _row;
}

bool span_context::take_continuation(const std::size_t column) noexcept
{
    if (_pending_colspan > 0)
    {
        --_pending_colspan;
        return true;
    }

    return is_covered(column);
}

bool span_context::record(const std::size_t column, const std::size_t colspan,
    const std::size_t rowspan)
{
    assert(colspan >= 1 && rowspan >= 1);

    const bool overlaps = _pending_colspan > 0 || is_covered(column);
    _pending_colspan = colspan - 1;

    if (_columns.size() < column + colspan)
    {
        _columns.resize(column + colspan);
    }

    for (std::size_t k = column; k < column + colspan; ++k)
    {
        _columns[k] = column_span{._origin_row = _row,
            ._last_row = _row + rowspan - 1};
    }

    return !overlaps;
}

std::vector<node> read_table_rows(const std::vector<table_line>& lines,
    const cell_reader& read_cell, const diagnostic_sink& report)
{
    std::vector<node> rows;
    span_context spans;

    const std::string row_close = close_marker("tableRow");
    bool expect_separator = false;

    for (const table_line& line : lines)
    {
        std::string_view text = trim(line._text);

        if (text.empty())
        {
            continue;
        }

        if (expect_separator)
        {
            expect_separator = false;

            if (is_separator_row(text))
            {
                continue;
            }
        }

        node row = make_node(node_kind::table_row);

        //
        // Row attributes ride in an empty marker after the final pipe
        // ----------------------------------------------------------------
        if (text.size() > row_close.size() &&
            text.substr(text.size() - row_close.size()) == row_close)
        {
            const std::size_t close_pos = text.size() - row_close.size();
            const std::size_t open_pos = text.rfind("<!--", close_pos - 1);

            decode_warnings warnings;
            const std::optional<marker> open =
                open_pos == std::string_view::npos
                    ? std::nullopt
                    : match_marker(text, open_pos, warnings);

            if (open.has_value() && open->_type == marker::type::open &&
                open->_tag._kind == "tableRow" &&
                open_pos + open->_length == close_pos)
            {
                row._attrs =
                    read_attributes(open->_tag, node_kind::table_row, warnings);

                text = trim(text.substr(0, open_pos));
            }
            else
            {
                report(diagnostic{._kind = diagnostic_kind::grammar_mismatch,
                    ._line = line._number,
                    ._message = "tableRow close marker without an open "
                                "marker"});
            }

            for (std::string& w : warnings)
            {
                report(diagnostic{
                    ._kind = diagnostic_kind::attribute_decode_error,
                    ._line = line._number,
                    ._message = std::move(w)});
            }
        }

        const std::size_t row_index = rows.size();
        spans.begin_row(row_index);

        const std::vector<std::string_view> slots = split_row(text);

        for (std::size_t col = 0; col < slots.size(); ++col)
        {
            const std::string_view slot = slots[col];

            if (slot.empty())
            {
                if (spans.take_continuation(col))
                {
                    continue;
                }

                row._content.push_back(make_node(node_kind::table_cell));
                (void)spans.record(col, 1, 1);
                continue;
            }

            node cell = read_cell(slot, row_index, line._number);

            std::size_t colspan = read_span(cell, "colspan");
            if (colspan > 1 && col + colspan > max_table_columns)
            {
                report(diagnostic{._kind = diagnostic_kind::grammar_mismatch,
                    ._line = line._number,
                    ._message = "colspan of the cell in column " +
                                std::to_string(col + 1) + " exceeds " +
                                std::to_string(max_table_columns) +
                                " columns"});

                colspan = col < max_table_columns ? max_table_columns - col : 1;
            }

            if (!spans.record(col, colspan, read_span(cell, "rowspan")))
            {
                report(diagnostic{._kind = diagnostic_kind::grammar_mismatch,
                    ._line = line._number,
                    ._message = "cell in column " + std::to_string(col + 1) +
                                " overlaps a spanning cell"});
            }

            row._content.push_back(std::move(cell));
        }

        rows.push_back(std::move(row));
        expect_separator = row_index == 0;
    }

    return rows;
}

} // namespace adfmd
