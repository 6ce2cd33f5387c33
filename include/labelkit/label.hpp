#pragma once

#include <labelkit/context.hpp>
#include <labelkit/log.hpp>
#include <labelkit/names.hpp>
#include <labelkit/value.hpp>
#include <string>
#include <vector>

namespace labelkit {

// Per-column label options as entered in the chart configuration.
struct LabelSettings {
    std::string template_text;   // empty: use the transformed column name
    std::string fallback;        // used when the render is empty or unresolved
    bool include_metrics = false;
    bool trim = true;
    bool escape_html = false;
};

// Compute the header label of one column: build the context, render the
// template, then apply trimming, fallback and escaping.
std::string dynamic_label(const LabelSettings& settings,
                          const ColumnDescriptor& column,
                          const std::vector<Record>& rows,
                          const Record& aux = {},
                          const std::vector<std::string>& metrics = {},
                          const NameTable& names = NameTable(),
                          const log::Logger& logger = {});

} // namespace labelkit
