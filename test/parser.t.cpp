#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <adfmd/diagnostics.hpp>
#include <adfmd/document.hpp>
#include <adfmd/parser.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using adfmd::make_mark;
using adfmd::make_node;
using adfmd::make_text;
using adfmd::mark_kind;
using adfmd::node;
using adfmd::node_kind;

[[nodiscard]] adfmd::parse_result parse_with(
    const std::string_view source, const bool infer_inline_cards = true)
{
    std::ostringstream err;
    adfmd::parser p{err};

    return p.parse({.infer_inline_cards = infer_inline_cards}, source);
}

// Parses text that must not produce diagnostics.
[[nodiscard]] node parse_clean(
    const std::string_view source, const bool infer_inline_cards = true)
{
    adfmd::parse_result result = parse_with(source, infer_inline_cards);

    REQUIRE(result._diagnostics.empty());
    REQUIRE(result._document._kind == node_kind::doc);

    return std::move(result._document);
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

[[nodiscard]] adfmd::mark link_to(const std::string& href)
{
    return make_mark(mark_kind::link, {{"href", href}});
}

} // namespace

TEST_CASE("parser paragraphs #0")
{
    REQUIRE(parse_clean("") == doc({}));
    REQUIRE(parse_clean("Hello world\n") == doc({paragraph("Hello world")}));
    REQUIRE(parse_clean("a\n\nb\n") == doc({paragraph("a"), paragraph("b")}));

    // A single newline inside a paragraph is kept as text.
    REQUIRE(parse_clean("a\nb\n") == doc({paragraph("a\nb")}));
}

TEST_CASE("parser carriage returns #0")
{
    REQUIRE(parse_clean("a\r\n\r\nb\r\n") ==
            doc({paragraph("a"), paragraph("b")}));
}

TEST_CASE("parser headings #0")
{
    const node expected = doc({
        make_node(node_kind::heading, {{"level", std::int64_t{1}}},
            {make_text("A")}),
        make_node(node_kind::heading, {{"level", std::int64_t{6}}},
            {make_text("F")}),
    });

    REQUIRE(parse_clean("# A\n\n###### F\n") == expected);
}

TEST_CASE("parser headings #1")
{
    REQUIRE(parse_clean("####### x\n") == doc({paragraph("####### x")}));
    REQUIRE(parse_clean("#x\n") == doc({paragraph("#x")}));
}

TEST_CASE("parser emphasis #0")
{
    const node expected = doc({paragraph({
        make_text("a", {make_mark(mark_kind::em)}),
        make_text(" "),
        make_text("b", {make_mark(mark_kind::strong)}),
        make_text(" "),
        make_text("c",
            {make_mark(mark_kind::em), make_mark(mark_kind::strong)}),
        make_text(" "),
        make_text("d", {make_mark(mark_kind::strike)}),
        make_text(" "),
        make_text("e", {make_mark(mark_kind::code)}),
    })});

    REQUIRE(parse_clean("*a* **b** ***c*** ~~d~~ `e`\n") == expected);
}

TEST_CASE("parser emphasis #1")
{
    // Unclosed delimiters stay literal.
    REQUIRE(parse_clean("a * b\n") == doc({paragraph("a * b")}));
    REQUIRE(parse_clean("**x\n") == doc({paragraph("**x")}));
    REQUIRE(parse_clean("``x\n") == doc({paragraph("``x")}));
}

TEST_CASE("parser annotated text #0")
{
    const node expected = doc({paragraph({make_text("text",
        {make_mark(mark_kind::strong), make_mark(mark_kind::underline)})})});

    REQUIRE(parse_clean("<!-- ADF:text:marks=\"underline\" -->**text**"
                        "<!-- /ADF:text -->\n") == expected);
}

TEST_CASE("parser annotated text #1")
{
    const node expected = doc({paragraph({
        make_text("a "),
        make_text("b", {make_mark(mark_kind::text_color,
                           {{"color", std::string{"#ff0000"}}})}),
    })});

    REQUIRE(parse_clean("a <!-- ADF:text:marks=\"textColor=#ff0000\" -->b"
                        "<!-- /ADF:text -->\n") == expected);
}

TEST_CASE("parser lists #0")
{
    const node inner =
        make_node(node_kind::bullet_list, {}, {item({paragraph("b")})});

    const node expected = doc({make_node(node_kind::bullet_list, {},
        {item({paragraph("a"), inner}), item({paragraph("c")})})});

    REQUIRE(parse_clean("- a\n  - b\n- c\n") == expected);
}

TEST_CASE("parser lists #1")
{
    const node ordered = make_node(node_kind::ordered_list,
        {{"order", std::int64_t{3}}},
        {item({paragraph("x")}), item({paragraph("y")})});

    REQUIRE(parse_clean("3. x\n4. y\n") == doc({ordered}));

    const node from_one =
        make_node(node_kind::ordered_list, {}, {item({paragraph("x")})});

    REQUIRE(parse_clean("1. x\n") == doc({from_one}));
}

TEST_CASE("parser lists #2")
{
    // A blank line followed by unindented text ends the list.
    const node list =
        make_node(node_kind::bullet_list, {}, {item({paragraph("a")})});

    REQUIRE(parse_clean("- a\n\nb\n") == doc({list, paragraph("b")}));

    const node empty_item = make_node(node_kind::bullet_list, {}, {item({})});
    REQUIRE(parse_clean("-\n") == doc({empty_item}));
}

TEST_CASE("parser list item attributes #0")
{
    const node list = make_node(node_kind::bullet_list, {},
        {make_node(node_kind::list_item, {{"localId", std::string{"i1"}}},
            {paragraph("a")})});

    REQUIRE(parse_clean("- <!-- ADF:listItem:localId=\"i1\" -->"
                        "<!-- /ADF:listItem -->a\n") == doc({list}));
}

TEST_CASE("parser code block #0")
{
    const node code = make_node(node_kind::code_block,
        {{"language", std::string{"cpp"}}}, {make_text("int x;\n```")});

    REQUIRE(parse_clean("````cpp\nint x;\n```\n````\n") == doc({code}));
}

TEST_CASE("parser code block #1")
{
    // An unclosed fence runs to the end of the text.
    const node code =
        make_node(node_kind::code_block, {}, {make_text("a\n\n# b")});

    REQUIRE(parse_clean("```\na\n\n# b\n") == doc({code}));
    REQUIRE(parse_clean("```\n```\n") ==
            doc({make_node(node_kind::code_block)}));
}

TEST_CASE("parser rule and blockquote #0")
{
    const node quote = make_node(node_kind::blockquote, {},
        {paragraph("a"), paragraph("b")});

    REQUIRE(parse_clean("---\n\n> a\n>\n> b\n") ==
            doc({make_node(node_kind::rule), quote}));
}

TEST_CASE("parser links #0")
{
    REQUIRE(parse_clean("[site](https://x.com)\n") ==
            doc({paragraph({make_text("site", {link_to("https://x.com")})})}));

    REQUIRE(parse_clean("[a](<x y(z)>)\n") ==
            doc({paragraph({make_text("a", {link_to("x y(z)")})})}));
}

TEST_CASE("parser inline cards #0")
{
    const node card = make_node(
        node_kind::inline_card, {{"url", std::string{"https://x.com"}}});

    REQUIRE(parse_clean("[https://x.com](https://x.com)\n") ==
            doc({paragraph({card})}));

    // The angle form always reads back as a link.
    const node link =
        make_text("https://x.com", {link_to("https://x.com")});

    REQUIRE(parse_clean("[https://x.com](<https://x.com>)\n") ==
            doc({paragraph({link})}));

    REQUIRE(parse_clean("[https://x.com](https://x.com)\n", false) ==
            doc({paragraph({link})}));
}

TEST_CASE("parser hard breaks #0")
{
    const node expected = doc({paragraph(
        {make_text("a"), make_node(node_kind::hard_break), make_text("b")})});

    REQUIRE(parse_clean("a  \nb\n") == expected);
    REQUIRE(parse_clean("a\\\nb\n") == expected);

    const node leading = doc({paragraph(
        {make_node(node_kind::hard_break), make_text("b")})});

    REQUIRE(parse_clean("\\\nb\n") == leading);
}

TEST_CASE("parser escapes #0")
{
    REQUIRE(parse_clean("\\# not \\* a heading\n") ==
            doc({paragraph("# not * a heading")}));

    REQUIRE(parse_clean("&#32;x&#32;\n") == doc({paragraph(" x ")}));
    REQUIRE(parse_clean("1\\. a\n") == doc({paragraph("1. a")}));
    REQUIRE(parse_clean("\\&#10; \\[x\\] \\<y>\n") ==
            doc({paragraph("&#10; [x] <y>")}));
}

TEST_CASE("parser inline atoms #0")
{
    const node status = make_node(node_kind::status,
        {{"text", std::string{"He said \"hi\""}},
            {"color", std::string{"green"}}});

    // The body is display text only; attributes are authoritative.
    REQUIRE(parse_clean("<!-- ADF:status:text=\"He said \\\"hi\\\"\","
                        "color=\"green\" -->edited<!-- /ADF:status -->\n") ==
            doc({paragraph({status})}));
}

TEST_CASE("parser table #0")
{
    const std::string_view source = //
        "<!-- ADF:table -->\n"
        "| A | B |\n"
        "| --- | --- |\n"
        "| c | d |\n"
        "<!-- /ADF:table -->\n";

    const auto cell = [](const node_kind kind, const std::string& text)
    { return make_node(kind, {}, {paragraph(text)}); };

    const node table = make_node(node_kind::table, {},
        {make_node(node_kind::table_row, {},
             {cell(node_kind::table_header, "A"),
                 cell(node_kind::table_header, "B")}),
            make_node(node_kind::table_row, {},
                {cell(node_kind::table_cell, "c"),
                    cell(node_kind::table_cell, "d")})});

    REQUIRE(parse_clean(source) == doc({table}));
}

TEST_CASE("parser panel #0")
{
    const std::string_view source = //
        "<!-- ADF:panel:panelType=\"info\" -->\n"
        "> **INFO**\n"
        ">\n"
        "> Note\n"
        "<!-- /ADF:panel -->\n";

    const node panel = make_node(node_kind::panel,
        {{"panelType", std::string{"info"}}}, {paragraph("Note")});

    REQUIRE(parse_clean(source) == doc({panel}));
}

TEST_CASE("parser unknown nodes #0")
{
    const std::string_view source = //
        "<!-- ADF:bodiedExtension:extensionKey=\"k\",count=5 -->\n"
        "x\n"
        "<!-- /ADF:bodiedExtension -->\n";

    const node extension = make_node("bodiedExtension",
        {{"extensionKey", std::string{"k"}}, {"count", std::int64_t{5}}},
        {paragraph("x")});

    REQUIRE(parse_clean(source) == doc({extension}));
}

TEST_CASE("parser unknown nodes #1")
{
    const node placeholder =
        make_node("placeholder", {{"text", std::string{"fill"}}});

    REQUIRE(parse_clean("a <!-- ADF:placeholder:text=\"fill\" -->"
                        "<!-- /ADF:placeholder -->\n") ==
            doc({paragraph({make_text("a "), placeholder})}));

    // On a line of its own the element is a block.
    REQUIRE(parse_clean("<!-- ADF:placeholder:text=\"fill\" -->"
                        "<!-- /ADF:placeholder -->\n") == doc({placeholder}));
}

TEST_CASE("parser media #0")
{
    const std::string_view source = //
        "<!-- ADF:mediaSingle -->\n"
        "<!-- ADF:media:id=\"abc\",type=\"file\",collection=\"c\" -->"
        "[](fileId:abc)<!-- /ADF:media -->\n"
        "<!-- /ADF:mediaSingle -->\n";

    const node media = make_node(node_kind::media,
        {{"id", std::string{"abc"}}, {"type", std::string{"file"}},
            {"collection", std::string{"c"}}});

    REQUIRE(parse_clean(source) ==
            doc({make_node(node_kind::media_single, {}, {media})}));
}

TEST_CASE("parser document wrapper #0")
{
    const std::string_view source = //
        "<!-- ADF:doc:version=\"1\" -->\n"
        "a\n"
        "<!-- /ADF:doc -->\n";

    REQUIRE(parse_clean(source) ==
            make_node(node_kind::doc, {{"version", std::int64_t{1}}},
                {paragraph("a")}));
}

TEST_CASE("parser unmatched open marker #0")
{
    std::ostringstream err;
    adfmd::parser p{err};

    const adfmd::parse_result result =
        p.parse({}, "intro\n\n<!-- ADF:panel -->\ntext\n");

    REQUIRE(result._diagnostics.size() == 1);

    const adfmd::diagnostic& d = result._diagnostics[0];
    REQUIRE(d._kind == adfmd::diagnostic_kind::grammar_mismatch);
    REQUIRE(d._line == 3);
    REQUIRE(d._message ==
            "open marker of 'panel' has no matching close marker");

    REQUIRE(err.str() ==
            "((ADFMD WARNING))(3): grammar mismatch: open marker of 'panel' "
            "has no matching close marker\n\n");

    // The marker line is kept as literal text.
    REQUIRE(result._document == doc({paragraph("intro"),
                                    paragraph("<!-- ADF:panel -->"),
                                    paragraph("text")}));
}

TEST_CASE("parser unmatched open marker #1")
{
    // Only the outer open lacks a close; the inner pair still matches.
    const adfmd::parse_result result =
        parse_with("a <!-- ADF:x -->b<!-- ADF:x -->c<!-- /ADF:x -->\n");

    REQUIRE(result._diagnostics.size() == 1);
    REQUIRE(result._diagnostics[0]._line == 1);

    REQUIRE(result._document ==
            doc({paragraph({make_text("a <!-- ADF:x -->b"),
                make_node("x", {}, {make_text("c")})})}));
}

TEST_CASE("parser unmatched open marker #2")
{
    const std::string_view source =
        "x <!-- ADF:foo --><!-- ADF:foo --><!-- ADF:foo -->\n";

    const adfmd::parse_result result = parse_with(source);

    REQUIRE(result._diagnostics.size() == 3);
    REQUIRE(result._document ==
            doc({paragraph(
                "x <!-- ADF:foo --><!-- ADF:foo --><!-- ADF:foo -->")}));
}

TEST_CASE("parser unmatched open marker #3")
{
    const adfmd::parse_result result = parse_with(
        "<!-- ADF:box -->\n<!-- ADF:box -->\n<!-- /ADF:box -->\n\n"
        "<!-- ADF:box -->\n<!-- ADF:box -->\n");

    REQUIRE(result._diagnostics.size() == 3);
    REQUIRE(result._diagnostics[0]._line == 1);
    REQUIRE(result._diagnostics[1]._line == 5);
    REQUIRE(result._diagnostics[2]._line == 6);

    REQUIRE(result._document == doc({paragraph("<!-- ADF:box -->"),
                                    make_node("box"),
                                    paragraph("<!-- ADF:box -->"),
                                    paragraph("<!-- ADF:box -->")}));
}

TEST_CASE("parser unmatched close marker #0")
{
    const adfmd::parse_result result =
        parse_with("x\ny <!-- /ADF:status --> z\n");

    REQUIRE(result._diagnostics.size() == 1);
    REQUIRE(result._diagnostics[0]._line == 2);
    REQUIRE(result._diagnostics[0]._message ==
            "close marker of 'status' has no matching open marker");

    REQUIRE(result._document ==
            doc({paragraph("x\ny <!-- /ADF:status --> z")}));
}

TEST_CASE("parser unmatched close marker #1")
{
    // Line numbers keep counting across inline constructs.
    const adfmd::parse_result result =
        parse_with("a\n**b** [c](d)\n*e* `f`\ng <!-- /ADF:status -->\n");

    REQUIRE(result._diagnostics.size() == 1);
    REQUIRE(result._diagnostics[0]._line == 4);
}

TEST_CASE("parser malformed attribute #0")
{
    const adfmd::parse_result result = parse_with(
        "<!-- ADF:status:text=\"ok\",color -->ok<!-- /ADF:status -->\n");

    REQUIRE(result._diagnostics.size() == 1);
    REQUIRE(result._diagnostics[0]._kind ==
            adfmd::diagnostic_kind::attribute_decode_error);
    REQUIRE(result._diagnostics[0]._line == 1);

    const node status =
        make_node(node_kind::status, {{"text", std::string{"ok"}}});

    REQUIRE(result._document == doc({paragraph({status})}));
}

TEST_CASE("parser nesting limit #0")
{
    std::string source;
    for (std::size_t i = 0; i < adfmd::max_nesting_depth + 50; ++i)
    {
        source += "> ";
    }

    source += "x\n";

    const adfmd::parse_result result = parse_with(source);

    REQUIRE(result._diagnostics.size() == 1);
    REQUIRE(result._diagnostics[0]._kind ==
            adfmd::diagnostic_kind::grammar_mismatch);

    // The part below the limit is kept as literal text.
    const node* n = &result._document;
    std::size_t quotes = 0;

    while (n->_content.size() == 1 &&
           n->_content[0]._kind == node_kind::blockquote)
    {
        n = &n->_content[0];
        ++quotes;
    }

    REQUIRE(quotes > 0);
    REQUIRE(quotes < adfmd::max_nesting_depth);
    REQUIRE(n->_content.size() == 1);
    REQUIRE(n->_content[0]._kind == node_kind::paragraph);

    const std::string& text = n->_content[0]._content[0]._text;
    REQUIRE(text.starts_with("> "));
    REQUIRE(text.ends_with("x"));
}
