// render_label.cpp
//
// Computes one column header from a TOML label configuration and a JSON
// file of query rows:
//
//     ./labelkit-render label.toml rows.json
//     ./labelkit-render label.toml rows.json --aux aux.json --verbose
//     ./labelkit-render label.toml --explain
//
// The global config (~/.labelkit/config.toml), when present, is layered
// under the given file. --explain prints the parsed template and the
// context instead of only the label.

#include <labelkit/config.hpp>
#include <labelkit/context.hpp>
#include <labelkit/label.hpp>
#include <labelkit/lang/template.hpp>
#include <labelkit/log.hpp>
#include <labelkit/result.hpp>
#include <labelkit/rows.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace labelkit;

struct Options {
    std::string config_path;
    std::string rows_path;
    std::string aux_path;
    bool verbose = false;
    bool explain = false;
};

static Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--explain") {
            opts.explain = true;
        } else if (arg == "--aux") {
            if (i + 1 >= argc) {
                return LabelError{LabelError::InvalidArg,
                    "--aux needs a file argument"};
            }
            opts.aux_path = argv[++i];
        } else if (opts.config_path.empty()) {
            opts.config_path = arg;
        } else if (opts.rows_path.empty()) {
            opts.rows_path = arg;
        } else {
            return LabelError{LabelError::InvalidArg,
                "unexpected argument: " + arg};
        }
    }

    if (opts.config_path.empty()) {
        return LabelError{
            LabelError::InvalidArg,
            "no label configuration specified",
            "usage: labelkit-render <label.toml> [rows.json] [--aux aux.json] [--verbose] [--explain]"
        };
    }
    return Result<Options>::ok(std::move(opts));
}

static Result<Config> load_config(const std::string& path) {
    std::optional<Config> global;
    auto global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto g = Config::load(global_path);
        LABELKIT_TRY(g);
        log::debug("loaded global config %s", global_path.c_str());
        global = std::move(g).value();
    }

    auto project = Config::load(path);
    LABELKIT_TRY(project);

    auto cfg = Config::effective(global, std::move(project).value(), std::nullopt);
    if (!cfg.column) {
        return LabelError{LabelError::Config,
            "no [column] section in configuration",
            "add [column] with at least key = \"...\"",
            path, 0};
    }
    return Result<Config>::ok(std::move(cfg));
}

static void explain(const std::string& text, const Context& ctx) {
    auto tmpl = Template::parse(text);
    std::cout << "-- Template (" << tmpl.nodes.size() << " nodes, "
              << tmpl.block_count() << " blocks) --\n";
    for (const auto& node : tmpl.nodes) {
        if (node.kind == NodeKind::Literal) {
            std::cout << "  literal \"" << node.text << "\"\n";
            continue;
        }
        std::cout << "  block " << node.source << "\n";
        for (size_t i = 0; i < node.branches.size(); ++i) {
            const auto& branch = node.branches[i];
            if (branch.condition) {
                const Condition& cond = *branch.condition;
                std::cout << "    " << tag_kind_name(i == 0 ? TagKind::If : TagKind::Elif)
                          << " " << condition_kind_name(cond.kind);
                if (cond.kind == ConditionKind::Compare) {
                    std::cout << " " << compare_op_name(cond.op);
                }
                std::cout << " [" << cond.source << "]";
            } else {
                std::cout << "    " << tag_kind_name(TagKind::Else);
            }
            std::cout << " -> \"" << branch.body << "\"\n";
        }
    }

    std::cout << "-- Context (" << ctx.size() << " values) --\n";
    for (const auto& [name, value] : ctx) {
        std::cout << "  " << name << " : " << kind_name(value.kind())
                  << " = " << value.display() << "\n";
    }
}

static Result<std::string> run(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    LABELKIT_TRY(opts);
    if (opts.value().verbose) log::set_level(log::Trace);

    auto cfg = load_config(opts.value().config_path);
    LABELKIT_TRY(cfg);

    std::vector<Record> rows;
    if (!opts.value().rows_path.empty()) {
        auto r = load_rows(opts.value().rows_path);
        LABELKIT_TRY(r);
        rows = std::move(r).value();
        log::info("loaded %zu rows", rows.size());
    }

    Record aux = cfg.value().aux;
    if (!opts.value().aux_path.empty()) {
        auto a = load_aux(opts.value().aux_path);
        LABELKIT_TRY(a);
        // Query-supplied values win over the static [aux] table.
        merge_fields(aux, a.value());
    }

    const Config& c = cfg.value();
    auto settings = c.label_settings();
    std::vector<std::string> metrics = c.metrics.value_or(std::vector<std::string>{});
    log::Logger logger(log::stderr_sink());

    if (opts.value().explain) {
        ContextOptions ctx_opts;
        ctx_opts.include_metrics = settings.include_metrics;
        explain(settings.template_text,
                build_context(*c.column, rows, aux, metrics, ctx_opts, logger));
    }

    return Result<std::string>::ok(
        dynamic_label(settings, *c.column, rows, aux, metrics, c.name_table(), logger));
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    std::cout << result.value() << "\n";
    return 0;
}
