#pragma once

#include "diagnostics.hpp"
#include "document.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adfmd {

class converter_state;

class converter
{
private:
    std::unique_ptr<converter_state> _state;

public:
    struct config
    {
        bool emit_annotations = true;
        bool infer_inline_cards = true;
    };

    [[nodiscard]] explicit converter(std::ostream& err_stream);
    ~converter();

    converter(const converter&) = delete;
    converter& operator=(const converter&) = delete;

    // Appends the Markdown rendering of `root`. Returns false on a structural
    // violation, available afterwards through `last_violation`.
    [[nodiscard]] bool to_markdown(const config& cfg,
        std::string& output_buffer, const node& root) noexcept;

    // Always stores the recovered tree in `output`. Returns false when the
    // text produced diagnostics, available through `last_diagnostics`.
    [[nodiscard]] bool from_markdown(const config& cfg, node& output,
        const std::string_view source) noexcept;

    [[nodiscard]] const std::optional<structural_violation>&
    last_violation() const noexcept;

    [[nodiscard]] const std::vector<diagnostic>&
    last_diagnostics() const noexcept;
};

} // namespace adfmd
