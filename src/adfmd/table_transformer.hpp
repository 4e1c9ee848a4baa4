#pragma once

#include "diagnostics.hpp"
#include "document.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cstddef>

namespace adfmd {

//
// Single-line encoding
// ----------------------------------------------------------------------------
// Newlines become `<br/>` and pipes become `\|`. A run of `k` backslashes in
// front of a pipe or of a literal `<br/>` is written as `2k+1` backslashes,
// in front of an encoded newline as `2k`, so decoding is decided by parity.

[[nodiscard]] std::string encode_single_line(const std::string_view text);
[[nodiscard]] std::string decode_single_line(const std::string_view text);

//
// Layout
// ----------------------------------------------------------------------------

// Upper bound on the column count a table may span to.
inline constexpr std::size_t max_table_columns = 1000;

// Row-major slots of a table; `nullptr` marks a position covered by a
// spanning cell.
using table_layout = std::vector<std::vector<const node*>>;

struct table_span_error
{
    std::size_t _row;
    std::optional<std::size_t> _cell;
    std::string _reason;
};

[[nodiscard]] std::optional<table_span_error> layout_table(
    const node& table, table_layout& layout);

[[nodiscard]] std::size_t column_count(const table_layout& layout) noexcept;

// `std::nullopt` slots are rendered as bare `|` placeholders.
[[nodiscard]] std::string render_row(
    const std::vector<std::optional<std::string>>& slots);

[[nodiscard]] std::string render_separator(const std::size_t columns);

[[nodiscard]] std::vector<std::string_view> split_row(std::string_view line);

[[nodiscard]] bool is_separator_row(std::string_view line) noexcept;

//
// Parsing
// ----------------------------------------------------------------------------

// Records, per column, the rows covered by the cell that owns it.
class span_context
{
private:
    struct column_span
    {
        std::size_t _origin_row;
        std::size_t _last_row;
    };

    std::vector<std::optional<column_span>> _columns;
    std::size_t _row{0};
    std::size_t _pending_colspan{0};

public:
    void begin_row(const std::size_t row) noexcept;

    // True when a cell of an earlier row spans into `column`.
    [[nodiscard]] bool is_covered(const std::size_t column) const noexcept;

    // Decides whether an empty slot at `column` continues a spanning cell.
    [[nodiscard]] bool take_continuation(const std::size_t column) noexcept;

    // Returns false when the cell lands on a position already spanned.
    [[nodiscard]] bool record(const std::size_t column,
        const std::size_t colspan, const std::size_t rowspan);
};

struct table_line
{
    std::string_view _text;
    std::size_t _number;
};

using cell_reader = std::function<node(const std::string_view slot,
    const std::size_t row, const std::size_t line)>;

using diagnostic_sink = std::function<void(diagnostic)>;

[[nodiscard]] std::vector<node> read_table_rows(
    const std::vector<table_line>& lines, const cell_reader& read_cell,
    const diagnostic_sink& report);

} // namespace adfmd
