#include <labelkit/label.hpp>
#include <labelkit/lang/template.hpp>
#include <labelkit/text.hpp>

namespace labelkit {

static std::string default_label(const ColumnDescriptor& column, const NameTable& names) {
    return names.transform(column.label.empty() ? column.key : column.label);
}

std::string dynamic_label(const LabelSettings& settings,
                          const ColumnDescriptor& column,
                          const std::vector<Record>& rows,
                          const Record& aux,
                          const std::vector<std::string>& metrics,
                          const NameTable& names,
                          const log::Logger& logger) {
    std::string label;

    if (trim_view(settings.template_text).empty()) {
        label = settings.fallback.empty() ? default_label(column, names)
                                          : settings.fallback;
    } else {
        ContextOptions options;
        options.include_metrics = settings.include_metrics;
        Context ctx = build_context(column, rows, aux, metrics, options, logger);

        label = render(settings.template_text, ctx, logger);
        if (settings.trim) label = trim(label);

        if (!settings.fallback.empty() &&
            (trim_view(label).empty() || has_unresolved_markers(label))) {
            logger.info("column '%s': template left \"%s\", using fallback label",
                        column.key.c_str(), label.c_str());
            label = settings.fallback;
        }
    }

    if (settings.escape_html) label = escape_html(label);
    return label;
}

} // namespace labelkit
