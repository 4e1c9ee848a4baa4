#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include <cstddef>

namespace adfmd {

enum class diagnostic_kind
{
    grammar_mismatch,
    attribute_decode_error
};

// Recoverable problem found while parsing text.
struct diagnostic
{
    diagnostic_kind _kind;
    std::size_t _line; // 1-based
    std::string _message;
};

// Invariant violation found while serializing a tree. Fatal for the call.
struct structural_violation
{
    std::string _path; // e.g. `/content/2/content/0`
    std::string _reason;
};

[[nodiscard]] std::string_view to_string(const diagnostic_kind kind) noexcept;

std::ostream& operator<<(std::ostream& os, const diagnostic& d);
std::ostream& operator<<(std::ostream& os, const structural_violation& v);

} // namespace adfmd
