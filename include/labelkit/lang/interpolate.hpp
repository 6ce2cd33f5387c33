#pragma once

#include <labelkit/context.hpp>
#include <labelkit/log.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace labelkit {

enum class SegmentKind { Literal, Placeholder };

// A slice of interpolation input. For placeholders `raw` is the whole
// "{{ name }}" marker and `name` its trimmed content; both view the input.
struct Segment {
    SegmentKind kind;
    std::string_view raw;
    std::string_view name;
};

// Single left-to-right pass. "{{" without a closing "}}" and markers with an
// empty name stay literal.
std::vector<Segment> split_placeholders(std::string_view text);

// Replace every "{{ name }}" whose name is a context key with the value's
// display form. Unknown names are left verbatim; substituted text is not
// scanned again.
std::string interpolate(std::string_view text, const Context& ctx,
                        const log::Logger& logger = {});

} // namespace labelkit
