#include <labelkit/config.hpp>
#include <toml++/toml.hpp>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace labelkit {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Result<std::optional<std::string>> string_field(const toml::table& tbl,
                                                       const char* section,
                                                       const char* name) {
    auto node = tbl[name];
    if (!node) return Result<std::optional<std::string>>::ok(std::nullopt);
    if (auto s = node.value<std::string>()) {
        return Result<std::optional<std::string>>::ok(std::string(*s));
    }
    return LabelError{LabelError::Config,
        std::string(section) + "." + name + " must be a string"};
}

static Result<std::optional<bool>> bool_field(const toml::table& tbl,
                                              const char* section,
                                              const char* name) {
    auto node = tbl[name];
    if (!node) return Result<std::optional<bool>>::ok(std::nullopt);
    if (!node.is_boolean()) {
        return LabelError{LabelError::Config,
            std::string(section) + "." + name + " must be true or false"};
    }
    return Result<std::optional<bool>>::ok(node.value<bool>());
}

static Result<ColumnDescriptor> parse_column(const toml::table& tbl) {
    ColumnDescriptor col;

    if (auto v = tbl["key"].value<std::string>()) col.key = std::string(*v);
    if (col.key.empty()) {
        return LabelError{LabelError::Config,
            "[column] requires a non-empty 'key'",
            "key is the field name of the column in each row"};
    }
    if (auto v = tbl["label"].value<std::string>()) col.label = std::string(*v);
    if (auto v = tbl["original-label"].value<std::string>()) {
        col.original_label = std::string(*v);
    }
    if (auto v = tbl["type"].value<std::string>()) col.data_type = std::string(*v);
    if (auto v = tbl["numeric"].value<bool>()) col.is_numeric = *v;
    if (auto v = tbl["metric"].value<bool>()) col.is_metric = *v;
    if (auto v = tbl["percent-metric"].value<bool>()) col.is_percent_metric = *v;

    if (col.label.empty()) col.label = col.key;
    return Result<ColumnDescriptor>::ok(std::move(col));
}

static Result<Value> aux_value(const std::string& name, const toml::node& node) {
    if (auto s = node.value_exact<std::string>()) return Result<Value>::ok(Value(*s));
    if (auto b = node.value_exact<bool>()) return Result<Value>::ok(Value(*b));
    if (auto i = node.value_exact<std::int64_t>()) {
        return Result<Value>::ok(Value(static_cast<double>(*i)));
    }
    if (auto d = node.value_exact<double>()) return Result<Value>::ok(Value(*d));
    return LabelError{LabelError::Config,
        "aux value '" + name + "' must be a string, number or boolean"};
}

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return LabelError{LabelError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [label] section
    if (auto label = doc["label"].as_table()) {
        auto tmpl = string_field(*label, "label", "template");
        if (tmpl.is_err()) return std::move(tmpl).error();
        cfg.template_text = tmpl.value();

        auto fallback = string_field(*label, "label", "fallback");
        if (fallback.is_err()) return std::move(fallback).error();
        cfg.fallback = fallback.value();

        auto include = bool_field(*label, "label", "include-metrics");
        if (include.is_err()) return std::move(include).error();
        cfg.include_metrics = include.value();

        auto trim = bool_field(*label, "label", "trim");
        if (trim.is_err()) return std::move(trim).error();
        cfg.trim = trim.value();

        auto escape = bool_field(*label, "label", "escape-html");
        if (escape.is_err()) return std::move(escape).error();
        cfg.escape_html = escape.value();
    }

    // [column] section
    if (auto column = doc["column"].as_table()) {
        auto col = parse_column(*column);
        if (col.is_err()) return std::move(col).error();
        cfg.column = std::move(col).value();
    }

    // [aliases] section
    if (auto aliases = doc["aliases"].as_table()) {
        for (const auto& [key, val] : *aliases) {
            if (auto s = val.value<std::string>()) {
                cfg.aliases[std::string(key)] = std::string(*s);
            } else {
                return LabelError{LabelError::Config,
                    "alias '" + std::string(key) + "' must be a string"};
            }
        }
    }

    // [aux] section
    if (auto aux = doc["aux"].as_table()) {
        for (const auto& [key, val] : *aux) {
            std::string name(key);
            auto v = aux_value(name, val);
            if (v.is_err()) return std::move(v).error();
            cfg.aux.emplace_back(name, std::move(v).value());
        }
    }

    // metrics = [...]
    if (auto arr = doc["metrics"].as_array()) {
        std::vector<std::string> ids;
        for (const auto& elem : *arr) {
            if (auto s = elem.value<std::string>()) {
                ids.push_back(std::string(*s));
            } else {
                return LabelError{LabelError::Config,
                    "metrics entries must be strings"};
            }
        }
        cfg.metrics = std::move(ids);
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LabelError{LabelError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err() && cfg.error().file.empty()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.template_text) template_text = other.template_text;
    if (other.fallback) fallback = other.fallback;
    if (other.include_metrics) include_metrics = other.include_metrics;
    if (other.trim) trim = other.trim;
    if (other.escape_html) escape_html = other.escape_html;

    // Column: replaced as a whole
    if (other.column) column = other.column;

    for (const auto& [k, v] : other.aliases) {
        aliases[k] = v;
    }

    // Aux: other overrides by name, new names appended
    merge_fields(aux, other.aux);

    if (other.metrics) metrics = other.metrics;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

LabelSettings Config::label_settings() const {
    LabelSettings s;
    if (template_text) s.template_text = *template_text;
    if (fallback) s.fallback = *fallback;
    if (include_metrics) s.include_metrics = *include_metrics;
    if (trim) s.trim = *trim;
    if (escape_html) s.escape_html = *escape_html;
    return s;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.labelkit/config.toml";
}

} // namespace labelkit
