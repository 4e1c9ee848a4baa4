#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <adfmd/converter.hpp>
#include <adfmd/document.hpp>

#include <array>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <cassert>

namespace {

using adfmd::make_mark;
using adfmd::make_node;
using adfmd::make_text;
using adfmd::mark_kind;
using adfmd::node;
using adfmd::node_kind;

[[nodiscard]] std::string& get_thread_local_buf(const std::size_t i)
{
    assert(i < 2);

    thread_local auto result = []
    {
        std::array<std::string, 2> bufs;

        for (std::string& buf : bufs)
        {
            buf.reserve(4096);
        }

        return bufs;
    }();

    return result[i];
}

// Tree to text, text back to tree, and the text once more. Both the tree and
// the text must survive unchanged.
void do_test_round_trip(const node& document)
{
    adfmd::converter cnvtr{std::cerr};

    std::string& first = get_thread_local_buf(0);
    first.clear();

    REQUIRE(cnvtr.to_markdown({}, first, document));

    node parsed;
    REQUIRE(cnvtr.from_markdown({}, parsed, first));
    REQUIRE(cnvtr.last_diagnostics().empty());
    REQUIRE(parsed == document);

    std::string& second = get_thread_local_buf(1);
    second.clear();

    REQUIRE(cnvtr.to_markdown({}, second, parsed));
    REQUIRE(second == first);
}

[[nodiscard]] node doc(std::vector<node> blocks)
{
    return make_node(node_kind::doc, {}, std::move(blocks));
}

[[nodiscard]] node paragraph(std::vector<node> inlines)
{
    return make_node(node_kind::paragraph, {}, std::move(inlines));
}

[[nodiscard]] node paragraph(const std::string& text)
{
    return paragraph({make_text(text)});
}

[[nodiscard]] node item(std::vector<node> blocks)
{
    return make_node(node_kind::list_item, {}, std::move(blocks));
}

[[nodiscard]] node cell(const node_kind kind, std::vector<node> blocks,
    adfmd::attributes attrs = {})
{
    return make_node(kind, std::move(attrs), std::move(blocks));
}

[[nodiscard]] node row(std::vector<node> cells)
{
    return make_node(node_kind::table_row, {}, std::move(cells));
}

[[nodiscard]] adfmd::mark mark_of(const mark_kind kind)
{
    return make_mark(kind);
}

[[nodiscard]] node kitchen_sink()
{
    std::vector<node> blocks;

    blocks.push_back(make_node(node_kind::heading,
        {{"level", std::int64_t{2}}}, {make_text("Overview")}));

    blocks.push_back(paragraph({
        make_text("Plain "),
        make_text("bold", {mark_of(mark_kind::strong)}),
        make_text(" and "),
        make_text("both",
            {mark_of(mark_kind::em), mark_of(mark_kind::strong)}),
        make_text(" "),
        make_text("gone", {mark_of(mark_kind::strike)}),
        make_text(" "),
        make_text("x+1", {mark_of(mark_kind::code)}),
        make_text(" "),
        make_text("under",
            {mark_of(mark_kind::strong), mark_of(mark_kind::underline)}),
        make_text("."),
    }));

    blocks.push_back(paragraph({
        make_text("See "),
        make_text("docs",
            {make_mark(mark_kind::link,
                {{"href", std::string{"https://example.com/docs"}}})}),
        make_text(" or "),
        make_node(node_kind::inline_card,
            {{"url", std::string{"https://example.com/card"}}}),
        make_text(" on "),
        make_node(node_kind::date,
            {{"timestamp", std::string{"1764708673000"}}}),
        make_text(" "),
        make_node(node_kind::status,
            {{"text", std::string{"In progress"}},
                {"color", std::string{"yellow"}}}),
        make_text(" "),
        make_node(node_kind::mention,
            {{"id", std::string{"u1"}}, {"text", std::string{"@ana"}}}),
        make_text(" "),
        make_node(node_kind::emoji,
            {{"shortName", std::string{":smile:"}},
                {"text", std::string{"\xF0\x9F\x98\x84"}}}),
    }));

    blocks.push_back(paragraph({make_text("line one"),
        make_node(node_kind::hard_break), make_text("line two")}));

    blocks.push_back(make_node(node_kind::bullet_list, {},
        {item({paragraph("first"),
             make_node(node_kind::bullet_list, {},
                 {item({paragraph("nested")})})}),
            item({paragraph("second")})}));

    blocks.push_back(make_node(node_kind::ordered_list,
        {{"order", std::int64_t{5}}},
        {item({paragraph("five")}), item({paragraph("six")})}));

    blocks.push_back(
        make_node(node_kind::blockquote, {}, {paragraph("quoted")}));

    blocks.push_back(make_node(node_kind::code_block,
        {{"language", std::string{"python"}}},
        {make_text("def f():\n    return 1")}));

    blocks.push_back(make_node(node_kind::rule));

    blocks.push_back(make_node(node_kind::table, {},
        {row({cell(node_kind::table_header, {paragraph("A")},
                  {{"colspan", std::int64_t{2}}}),
             cell(node_kind::table_header, {paragraph("C")})}),
            row({cell(node_kind::table_cell, {paragraph("D")}),
                cell(node_kind::table_cell,
                    {paragraph("E1"), paragraph("E2")},
                    {{"rowspan", std::int64_t{2}}}),
                cell(node_kind::table_cell, {paragraph("F")})}),
            row({cell(node_kind::table_cell, {paragraph("G")}),
                cell(node_kind::table_cell, {paragraph("H")})})}));

    blocks.push_back(make_node(node_kind::panel,
        {{"panelType", std::string{"info"}}}, {paragraph("Heads up")}));

    // The code line looks like the expand's own close marker.
    blocks.push_back(make_node(node_kind::expand,
        {{"title", std::string{"Details"}}},
        {make_node(node_kind::code_block, {},
            {make_text("<!-- /ADF:expand -->")})}));

    blocks.push_back(make_node(node_kind::media_single,
        {{"layout", std::string{"center"}}},
        {make_node(node_kind::media,
             {{"id", std::string{"abc"}}, {"type", std::string{"file"}},
                 {"collection", std::string{"c"}}}),
            make_node(node_kind::caption, {}, {make_text("Figure 1")})}));

    blocks.push_back(make_node("bodiedExtension",
        {{"extensionKey", std::string{"k"}}, {"count", std::int64_t{5}}},
        {paragraph("inside")}));

    blocks.push_back(paragraph({make_text("before "),
        make_node("placeholder", {{"text", std::string{"fill"}}}),
        make_text(" after")}));

    blocks.push_back(make_node(node_kind::paragraph,
        {{"localId", std::string{"p1"}}}, {make_text("tagged")}));

    blocks.push_back(make_node(node_kind::paragraph));

    return make_node(
        node_kind::doc, {{"version", std::int64_t{1}}}, std::move(blocks));
}

} // namespace

TEST_CASE("roundtrip kitchen sink #0")
{
    do_test_round_trip(kitchen_sink());
}

TEST_CASE("roundtrip kitchen sink #1")
{
    // Every top-level block also survives on its own.
    const node sink = kitchen_sink();

    for (const node& block : sink._content)
    {
        do_test_round_trip(doc({block}));
    }
}

TEST_CASE("roundtrip escaping #0")
{
    do_test_round_trip(doc({paragraph("- *not* `code` [x](y) "
                                      "<!-- ADF:rule --> \\ &#10; "
                                      "~~s~~ | > # end  ")}));

    do_test_round_trip(doc({paragraph("1) x"), paragraph("+ y"),
        paragraph("a\nb\r\nc"), paragraph("  padded  ")}));

    do_test_round_trip(doc({paragraph("```"), paragraph("---")}));
}

TEST_CASE("roundtrip escaping #1")
{
    // Inside a table every cell is squeezed onto a single line.
    const node table = make_node(node_kind::table, {},
        {row({cell(node_kind::table_header,
            {paragraph("a|b"), paragraph("x<br/>y\\")})})});

    do_test_round_trip(doc({table}));
}

TEST_CASE("roundtrip code mark with newline #0")
{
    do_test_round_trip(doc({paragraph({make_text("a "),
        make_text("x\ny", {mark_of(mark_kind::code)})})}));

    do_test_round_trip(doc({paragraph(
        {make_text("tick ` inside", {mark_of(mark_kind::code)})})}));
}

TEST_CASE("roundtrip links #0")
{
    const auto link = [](const std::string& text, adfmd::attributes attrs)
    { return make_text(text, {make_mark(mark_kind::link, std::move(attrs))}); };

    do_test_round_trip(doc({paragraph({
        link("space", {{"href", std::string{"https://x.com/a b"}}}),
        make_text(" "),
        link("https://x.com", {{"href", std::string{"https://x.com"}}}),
        make_text(" "),
        link("titled", {{"href", std::string{"https://x.com"}},
                           {"title", std::string{"T"}}}),
    })}));
}

TEST_CASE("roundtrip annotated marks #0")
{
    do_test_round_trip(doc({paragraph({
        make_text("red", {make_mark(mark_kind::text_color,
                             {{"color", std::string{"#ff0000"}}})}),
        make_text(" "),
        make_text("framed",
            {make_mark("border",
                {{"size", std::int64_t{2}}, {"color", std::string{"#ccc"}}})}),
    })}));
}

TEST_CASE("roundtrip annotated marks #1")
{
    do_test_round_trip(doc({paragraph({
        make_text("note", {make_mark("annotation",
                              {{"id", std::string{"007"}},
                                  {"annotationType", std::string{"inline"}}})}),
        make_text(" "),
        make_text("framed", {make_mark("border",
                                {{"size", std::string{"2"}},
                                    {"color", std::string{"#ccc"}}})}),
    })}));
}

TEST_CASE("roundtrip list item attributes #0")
{
    const node list = make_node(node_kind::bullet_list, {},
        {make_node(node_kind::list_item, {{"localId", std::string{"i1"}}},
             {paragraph("a")}),
            item({})});

    do_test_round_trip(doc({list}));
}

TEST_CASE("roundtrip wrapped native blocks #0")
{
    do_test_round_trip(doc({
        make_node(node_kind::ordered_list, {{"order", std::int64_t{1}}},
            {item({paragraph("one")})}),
        make_node(node_kind::bullet_list, {{"localId", std::string{"l1"}}},
            {item({paragraph("two")})}),
        make_node(node_kind::rule, {{"localId", std::string{"r1"}}}),
        make_node(node_kind::code_block, {{"language", std::string{"a b"}}},
            {make_text("x")}),
    }));
}

TEST_CASE("roundtrip inline cell content #0")
{
    // Cells holding bare inlines read back wrapped in a paragraph.
    adfmd::converter cnvtr{std::cerr};

    const node table = make_node(node_kind::table, {},
        {row({cell(node_kind::table_header, {make_text("A")})})});

    std::string& output = get_thread_local_buf(0);
    output.clear();

    REQUIRE(cnvtr.to_markdown({}, output, doc({table})));

    node parsed;
    REQUIRE(cnvtr.from_markdown({}, parsed, output));

    const node expected = make_node(node_kind::table, {},
        {row({cell(node_kind::table_header, {paragraph("A")})})});

    REQUIRE(parsed == doc({expected}));
}
