#pragma once

#include "diagnostics.hpp"
#include "document.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace adfmd {

class serializer
{
private:
    std::ostream& _err_stream;

public:
    struct config
    {
        // When false, plain Markdown is produced without annotations. The
        // result no longer round-trips.
        bool emit_annotations = true;
    };

    [[nodiscard]] explicit serializer(std::ostream& err_stream);

    // Appends the Markdown rendering of `root` to `output_buffer`. On
    // failure the buffer contents are unspecified.
    [[nodiscard]] std::optional<structural_violation> serialize(
        const config& cfg, std::string& output_buffer,
        const node& root) noexcept;
};

} // namespace adfmd
