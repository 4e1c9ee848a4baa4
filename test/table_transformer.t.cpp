#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <adfmd/diagnostics.hpp>
#include <adfmd/document.hpp>
#include <adfmd/table_transformer.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

[[nodiscard]] adfmd::node cell(const adfmd::node_kind kind,
    const std::string& text, adfmd::attributes attrs = {})
{
    return adfmd::make_node(kind, std::move(attrs),
        {adfmd::make_node(
            adfmd::node_kind::paragraph, {}, {adfmd::make_text(text)})});
}

[[nodiscard]] adfmd::node row(std::vector<adfmd::node> cells)
{
    return adfmd::make_node(adfmd::node_kind::table_row, {}, std::move(cells));
}

// 3x3 grid: `A` spans two columns of the header row, `E` spans two rows.
[[nodiscard]] adfmd::node spanning_table()
{
    using adfmd::node_kind;

    return adfmd::make_node(node_kind::table, {},
        {row({cell(node_kind::table_header, "A",
                  {{"colspan", std::int64_t{2}}}),
             cell(node_kind::table_header, "C")}),
            row({cell(node_kind::table_cell, "D"),
                cell(node_kind::table_cell, "E",
                    {{"rowspan", std::int64_t{2}}}),
                cell(node_kind::table_cell, "F")}),
            row({cell(node_kind::table_cell, "G"),
                cell(node_kind::table_cell, "H")})});
}

} // namespace

TEST_CASE("table_transformer single line #0")
{
    REQUIRE(adfmd::encode_single_line("a\nb|c") == R"(a<br/>b\|c)");
    REQUIRE(adfmd::decode_single_line(R"(a<br/>b\|c)") == "a\nb|c");
}

TEST_CASE("table_transformer single line #1")
{
    // A literal `<br/>` and a backslash before a newline survive.
    const std::string text = "x\\<br/>y\\\nz";
    const std::string encoded = adfmd::encode_single_line(text);

    REQUIRE(encoded == R"(x\\\<br/>y\\<br/>z)");
    REQUIRE(encoded.find('\n') == std::string::npos);
    REQUIRE(adfmd::decode_single_line(encoded) == text);
}

TEST_CASE("table_transformer split_row #0")
{
    const std::vector<std::string_view> slots =
        adfmd::split_row("| a || b |");

    REQUIRE(slots.size() == 3);
    REQUIRE(slots[0] == "a");
    REQUIRE(slots[1].empty());
    REQUIRE(slots[2] == "b");
}

TEST_CASE("table_transformer split_row #1")
{
    REQUIRE(adfmd::split_row("|").empty());

    const std::vector<std::string_view> slots =
        adfmd::split_row(R"(| a \| b | c |)");

    REQUIRE(slots.size() == 2);
    REQUIRE(slots[0] == R"(a \| b)");
    REQUIRE(slots[1] == "c");
}

TEST_CASE("table_transformer separator #0")
{
    CHECK(adfmd::is_separator_row("| --- | --- |"));
    CHECK(adfmd::is_separator_row("|:---|---:|"));
    CHECK(!adfmd::is_separator_row("| a | --- |"));
    CHECK(!adfmd::is_separator_row("--- | ---"));

    CHECK(adfmd::render_separator(3) == "| --- | --- | --- |");
}

TEST_CASE("table_transformer render_row #0")
{
    REQUIRE(adfmd::render_row({std::string{"a"}, std::nullopt,
                std::string{"b"}}) == "| a || b |");
}

TEST_CASE("table_transformer layout #0")
{
    const adfmd::node table = spanning_table();

    adfmd::table_layout layout;
    REQUIRE(!adfmd::layout_table(table, layout).has_value());

    REQUIRE(layout.size() == 3);
    REQUIRE(adfmd::column_count(layout) == 3);

    REQUIRE(layout[0].size() == 3);
    REQUIRE(layout[0][0] == &table._content[0]._content[0]);
    REQUIRE(layout[0][1] == nullptr);
    REQUIRE(layout[0][2] == &table._content[0]._content[1]);

    REQUIRE(layout[1][1] == &table._content[1]._content[1]);

    REQUIRE(layout[2].size() == 3);
    REQUIRE(layout[2][0] == &table._content[2]._content[0]);
    REQUIRE(layout[2][1] == nullptr);
    REQUIRE(layout[2][2] == &table._content[2]._content[1]);
}

TEST_CASE("table_transformer layout rowspan past the end #0")
{
    using adfmd::node_kind;

    const adfmd::node table = adfmd::make_node(node_kind::table, {},
        {row({cell(node_kind::table_cell, "A",
            {{"rowspan", std::int64_t{2}}})})});

    adfmd::table_layout layout;
    const std::optional<adfmd::table_span_error> error =
        adfmd::layout_table(table, layout);

    REQUIRE(error.has_value());
    REQUIRE(error->_row == 0);
    REQUIRE(error->_cell == 0);
}

TEST_CASE("table_transformer layout bad span #0")
{
    using adfmd::node_kind;

    const adfmd::node table = adfmd::make_node(node_kind::table, {},
        {row({cell(node_kind::table_cell, "A",
            {{"colspan", std::int64_t{0}}})})});

    adfmd::table_layout layout;
    REQUIRE(adfmd::layout_table(table, layout).has_value());
}

TEST_CASE("table_transformer layout bad span #1")
{
    using adfmd::node_kind;

    const adfmd::node table = adfmd::make_node(node_kind::table, {},
        {row({cell(node_kind::table_cell, "A"),
            cell(node_kind::table_cell, "B",
                {{"colspan", std::int64_t{4000000000}}})})});

    adfmd::table_layout layout;
    const std::optional<adfmd::table_span_error> error =
        adfmd::layout_table(table, layout);

    REQUIRE(error.has_value());
    REQUIRE(error->_row == 0);
    REQUIRE(error->_cell == 1);
}

TEST_CASE("table_transformer layout wrong child #0")
{
    const adfmd::node table = adfmd::make_node(adfmd::node_kind::table, {},
        {adfmd::make_node(adfmd::node_kind::paragraph)});

    adfmd::table_layout layout;
    const std::optional<adfmd::table_span_error> error =
        adfmd::layout_table(table, layout);

    REQUIRE(error.has_value());
    REQUIRE(!error->_cell.has_value());
}

TEST_CASE("table_transformer span_context #0")
{
    adfmd::span_context spans;

    spans.begin_row(0);
    REQUIRE(spans.record(0, 2, 1));
    REQUIRE(spans.take_continuation(1));
    REQUIRE(spans.record(2, 1, 2));

    spans.begin_row(1);
    REQUIRE(!spans.is_covered(0));
    REQUIRE(!spans.is_covered(1));
    REQUIRE(spans.is_covered(2));
    REQUIRE(spans.record(0, 1, 1));

    // Lands on the column still covered by the cell from row 0.
    REQUIRE(!spans.record(2, 1, 1));
}

TEST_CASE("table_transformer read_table_rows #0")
{
    const std::vector<adfmd::table_line> lines{
        {"| a | b |", 1},
        {"| --- | --- |", 2},
        {"| c | d | <!-- ADF:tableRow:localId=\"r1\" -->"
         "<!-- /ADF:tableRow -->",
            3},
    };

    std::vector<adfmd::diagnostic> diagnostics;

    const std::vector<adfmd::node> rows = adfmd::read_table_rows(
        lines,
        [](const std::string_view slot, const std::size_t r, std::size_t)
        {
            return cell(r == 0 ? adfmd::node_kind::table_header
                               : adfmd::node_kind::table_cell,
                std::string{slot});
        },
        [&](adfmd::diagnostic d) { diagnostics.push_back(std::move(d)); });

    REQUIRE(diagnostics.empty());
    REQUIRE(rows.size() == 2);

    REQUIRE(rows[0]._content.size() == 2);
    REQUIRE(rows[0]._content[0]._kind == adfmd::node_kind::table_header);
    REQUIRE(rows[0]._attrs.empty());

    REQUIRE(rows[1]._content.size() == 2);
    REQUIRE(rows[1]._content[1] == cell(adfmd::node_kind::table_cell, "d"));
    REQUIRE(*adfmd::get_string(rows[1]._attrs, "localId") == "r1");
}

TEST_CASE("table_transformer read_table_rows empty slot #0")
{
    const std::vector<adfmd::table_line> lines{
        {"| a | b |", 1},
        {"| --- | --- |", 2},
        {"| | d |", 3},
    };

    const std::vector<adfmd::node> rows = adfmd::read_table_rows(
        lines,
        [](const std::string_view slot, std::size_t, std::size_t)
        { return cell(adfmd::node_kind::table_cell, std::string{slot}); },
        [](adfmd::diagnostic) { FAIL("unexpected diagnostic"); });

    REQUIRE(rows.size() == 2);
    REQUIRE(rows[1]._content.size() == 2);
    REQUIRE(rows[1]._content[0] ==
            adfmd::make_node(adfmd::node_kind::table_cell));
}

TEST_CASE("table_transformer read_table_rows wide span #0")
{
    const std::vector<adfmd::table_line> lines{{"| a | b |", 4}};

    std::vector<adfmd::diagnostic> diagnostics;

    const std::vector<adfmd::node> rows = adfmd::read_table_rows(
        lines,
        [](const std::string_view slot, std::size_t, std::size_t)
        {
            return cell(adfmd::node_kind::table_header, std::string{slot},
                {{"colspan", std::int64_t{4000000000}}});
        },
        [&](adfmd::diagnostic d) { diagnostics.push_back(std::move(d)); });

    // The oversized span is reported and the cells are kept as written.
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0]._content.size() == 2);
    REQUIRE(adfmd::get_integer(rows[0]._content[0]._attrs, "colspan") ==
            4000000000);

    REQUIRE(!diagnostics.empty());
    REQUIRE(diagnostics[0]._kind == adfmd::diagnostic_kind::grammar_mismatch);
    REQUIRE(diagnostics[0]._line == 4);
}
