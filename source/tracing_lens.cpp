// tracing_lens.cpp
// Log formatting for TracingLens

#include <optics/tracing_lens.h>

#include <ostream>

namespace optics::detail {

void write_trace(std::ostream& os, std::string_view operation, const LensPath& path)
{
    os << "[TracingLens] " << operation << " " << path << "\n";
}

} // namespace optics::detail
