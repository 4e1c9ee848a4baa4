#pragma once

#include "diagnostics.hpp"
#include "document.hpp"

#include <iosfwd>
#include <string_view>
#include <vector>

namespace adfmd {

struct parse_result
{
    node _document; // always a `doc`
    std::vector<diagnostic> _diagnostics;
};

class parser
{
private:
    std::ostream& _err_stream;

public:
    struct config
    {
        // Read `[url](url)` with a plain label as an inlineCard.
        bool infer_inline_cards = true;
    };

    [[nodiscard]] explicit parser(std::ostream& err_stream);

    // Never fails: malformed annotations are recovered from locally and
    // reported as diagnostics.
    [[nodiscard]] parse_result parse(
        const config& cfg, const std::string_view source) noexcept;
};

} // namespace adfmd
