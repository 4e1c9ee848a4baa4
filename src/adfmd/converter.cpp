#include "converter.hpp"

#include "diagnostics.hpp"
#include "document.hpp"
#include "parser.hpp"
#include "serializer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace adfmd {

class converter_state
{
public:
    serializer _serializer;
    parser _parser;
    std::optional<structural_violation> _violation;
    std::vector<diagnostic> _diagnostics;

    [[nodiscard]] explicit converter_state(std::ostream& err_stream)
        : _serializer{err_stream}, _parser{err_stream}
    {}

    void clear_results()
    {
        _violation.reset();
        _diagnostics.clear();
    }
};

converter::converter(std::ostream& err_stream)
    : _state{std::make_unique<converter_state>(err_stream)}
{}

converter::~converter() = default;

bool converter::to_markdown(const config& cfg, std::string& output_buffer,
    const node& root) noexcept
{
    _state->clear_results();

    const serializer::config serializer_cfg{
        .emit_annotations = cfg.emit_annotations //
    };

    _state->_violation =
        _state->_serializer.serialize(serializer_cfg, output_buffer, root);

    return !_state->_violation.has_value();
}

bool converter::from_markdown(
    const config& cfg, node& output, const std::string_view source) noexcept
{
    _state->clear_results();

    const parser::config parser_cfg{
        .infer_inline_cards = cfg.infer_inline_cards //
    };

    parse_result result = _state->_parser.parse(parser_cfg, source);

    output = std::move(result._document);
    _state->_diagnostics = std::move(result._diagnostics);

    return _state->_diagnostics.empty();
}

const std::optional<structural_violation>&
converter::last_violation() const noexcept
{
    return _state->_violation;
}

const std::vector<diagnostic>& converter::last_diagnostics() const noexcept
{
    return _state->_diagnostics;
}

} // namespace adfmd
