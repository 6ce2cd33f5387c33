#pragma once

#include <labelkit/context.hpp>
#include <labelkit/label.hpp>
#include <labelkit/names.hpp>
#include <labelkit/result.hpp>
#include <labelkit/value.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace labelkit {

// Layered label configuration: global > project > local.
// Later layers override earlier ones field by field.
//
//   metrics = ["SUM(sell_in)"]
//
//   [label]
//   template = "{{column_name}} ({{row_count}} rows)"
//   fallback = "Sales"
//   include-metrics = true
//
//   [column]
//   label = "Sales"
//   key = "SUM(sell_in)"
//   type = "NUMERIC"
//   numeric = true
//
//   [aliases]
//   sell_in = "Sell In"
//
//   [aux]
//   "MAX(anio_id)" = 2024
struct Config {
    std::optional<std::string> template_text;
    std::optional<std::string> fallback;
    std::optional<bool> include_metrics;
    std::optional<bool> trim;
    std::optional<bool> escape_html;

    std::optional<ColumnDescriptor> column;
    std::unordered_map<std::string, std::string> aliases;
    Record aux;
    std::optional<std::vector<std::string>> metrics;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& local);

    // Settings with defaults applied for anything left unset.
    LabelSettings label_settings() const;

    NameTable name_table() const { return NameTable(aliases); }
};

// Discover the global config file path: ~/.labelkit/config.toml
std::string global_config_path();

} // namespace labelkit
