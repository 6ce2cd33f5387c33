#include <labelkit/context.hpp>
#include <algorithm>
#include <cmath>

namespace labelkit {

// ---- Context ----

Context::Context(std::initializer_list<Entry> entries) {
    for (const auto& [name, value] : entries) {
        set(name, value);
    }
}

void Context::set(const std::string& name, Value v) {
    auto it = index_.find(name);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(v);
        return;
    }
    index_.emplace(name, entries_.size());
    entries_.emplace_back(name, std::move(v));
}

bool Context::insert(const std::string& name, Value v) {
    if (index_.count(name)) return false;
    index_.emplace(name, entries_.size());
    entries_.emplace_back(name, std::move(v));
    return true;
}

const Value* Context::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

// ---- Builder ----

const std::vector<std::string>& reserved_names() {
    static const std::vector<std::string> names = {
        "column_name", "original_label", "key", "data_type",
        "row_count", "first_row", "last_row",
        "is_metric", "is_percent_metric", "is_numeric",
        "first_value", "last_value",
        "sum", "avg", "min", "max", "count",
        "metrics", "metric_count",
    };
    return names;
}

bool is_reserved_name(const std::string& name) {
    const auto& names = reserved_names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::optional<ColumnStats> column_stats(const std::vector<Record>& rows,
                                        const std::string& key) {
    ColumnStats stats;
    for (const auto& row : rows) {
        const Value* cell = find_field(row, key);
        if (!cell || !cell->is_number()) continue;
        double n = cell->as_number();
        if (std::isnan(n)) continue;

        if (stats.count == 0) {
            stats.min = n;
            stats.max = n;
        } else {
            stats.min = std::min(stats.min, n);
            stats.max = std::max(stats.max, n);
        }
        stats.sum += n;
        ++stats.count;
    }

    if (stats.count == 0) return std::nullopt;
    stats.avg = stats.sum / static_cast<double>(stats.count);
    return stats;
}

static Value cell_or_absent(const Record& row, const std::string& key) {
    const Value* cell = find_field(row, key);
    return cell ? *cell : Value::absent();
}

Context build_context(const ColumnDescriptor& column,
                      const std::vector<Record>& rows,
                      const Record& aux,
                      const std::vector<std::string>& metrics,
                      const ContextOptions& options,
                      const log::Logger& logger) {
    Context ctx;

    Record first_row = rows.empty() ? Record{} : rows.front();
    Record last_row = rows.empty() ? Record{} : rows.back();

    ctx.set("column_name", column.label);
    ctx.set("original_label",
            column.original_label.empty() ? column.label : column.original_label);
    ctx.set("key", column.key);
    ctx.set("data_type", column.data_type);
    ctx.set("row_count", static_cast<double>(rows.size()));
    ctx.set("first_value", cell_or_absent(first_row, column.key));
    ctx.set("last_value", cell_or_absent(last_row, column.key));
    ctx.set("first_row", std::move(first_row));
    ctx.set("last_row", std::move(last_row));
    ctx.set("is_metric", column.is_metric);
    ctx.set("is_percent_metric", column.is_percent_metric);
    ctx.set("is_numeric", column.is_numeric);

    if (auto stats = column_stats(rows, column.key)) {
        ctx.set("sum", stats->sum);
        ctx.set("avg", stats->avg);
        ctx.set("min", stats->min);
        ctx.set("max", stats->max);
        ctx.set("count", static_cast<double>(stats->count));
    } else {
        logger.debug("column '%s': no numeric values, statistics omitted",
                     column.key.c_str());
    }

    if (options.include_metrics) {
        List ids;
        ids.reserve(metrics.size());
        for (const auto& m : metrics) ids.emplace_back(m);
        ctx.set("metric_count", static_cast<double>(ids.size()));
        ctx.set("metrics", std::move(ids));
    }

    for (const auto& [name, value] : aux) {
        if (is_reserved_name(name)) {
            logger.debug("auxiliary value '%s' ignored: name is reserved",
                         name.c_str());
            continue;
        }
        if (!ctx.insert(name, value)) {
            logger.debug("auxiliary value '%s' ignored: duplicate name",
                         name.c_str());
        }
    }

    return ctx;
}

} // namespace labelkit
