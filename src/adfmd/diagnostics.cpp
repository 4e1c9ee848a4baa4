#include "diagnostics.hpp"

#include <ostream>
#include <string_view>

namespace adfmd {

std::string_view to_string(const diagnostic_kind kind) noexcept
{
    switch (kind)
    {
        case diagnostic_kind::grammar_mismatch: return "grammar mismatch";
        case diagnostic_kind::attribute_decode_error:
            return "attribute decode error";
    }

    return "diagnostic";
}

std::ostream& operator<<(std::ostream& os, const diagnostic& d)
{
    return os << "((ADFMD WARNING))(" << d._line << "): " << to_string(d._kind)
              << ": " << d._message << "\n\n";
}

std::ostream& operator<<(std::ostream& os, const structural_violation& v)
{
    return os << "((ADFMD ERROR))(" << (v._path.empty() ? "/" : v._path)
              << "): structural violation: " << v._reason << "\n\n";
}

} // namespace adfmd
