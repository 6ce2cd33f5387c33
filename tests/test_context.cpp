#include <catch2/catch.hpp>
#include <labelkit/context.hpp>
#include <string>
#include <vector>

using namespace labelkit;

namespace {

struct CaptureSink : log::Sink {
    std::vector<std::string> lines;
    void write(log::Level, const std::string& message) override {
        lines.push_back(message);
    }
};

ColumnDescriptor sales_column() {
    ColumnDescriptor col;
    col.label = "Sales";
    col.key = "sales";
    col.data_type = "NUMERIC";
    col.is_numeric = true;
    col.is_metric = true;
    return col;
}

std::vector<Record> sales_rows() {
    return {
        {{"region", "north"}, {"sales", 10}},
        {{"region", "south"}, {"sales", 999}},
        {{"region", "east"},  {"sales", 50}},
    };
}

} // namespace

// ===== Context container =====

TEST_CASE("context keeps insertion order and replaces on set", "[context]") {
    Context ctx;
    ctx.set("b", 1);
    ctx.set("a", 2);
    ctx.set("b", 3);

    REQUIRE(ctx.size() == 2);
    REQUIRE(ctx.begin()->first == "b");
    REQUIRE(ctx.find("b")->as_number() == 3);
}

TEST_CASE("context insert does not overwrite", "[context]") {
    Context ctx{{"key", "SUM(sell_in)"}};
    REQUIRE_FALSE(ctx.insert("key", "other"));
    REQUIRE(ctx.insert("extra", 1));
    REQUIRE(ctx.find("key")->as_text() == "SUM(sell_in)");
    REQUIRE(ctx.contains("extra"));
    REQUIRE_FALSE(ctx.contains("missing"));
}

// ===== Statistics =====

TEST_CASE("column_stats over numeric cells", "[context][stats]") {
    auto stats = column_stats(sales_rows(), "sales");
    REQUIRE(stats.has_value());
    REQUIRE(stats->min == 10);
    REQUIRE(stats->max == 999);
    REQUIRE(stats->sum == 1059);
    REQUIRE(stats->avg == Approx(353));
    REQUIRE(stats->count == 3);
}

TEST_CASE("column_stats skips null and non-numeric cells", "[context][stats]") {
    std::vector<Record> rows = {
        {{"v", Value()}},
        {{"v", "12"}},
        {{"v", -4}},
        {{"other", 100}},
        {{"v", 6}},
    };
    auto stats = column_stats(rows, "v");
    REQUIRE(stats.has_value());
    REQUIRE(stats->count == 2);
    REQUIRE(stats->sum == 2);
    REQUIRE(stats->min == -4);
    REQUIRE(stats->max == 6);
}

TEST_CASE("column_stats absent without numeric cells", "[context][stats]") {
    std::vector<Record> rows = {{{"v", "a"}}, {{"v", Value()}}};
    REQUIRE_FALSE(column_stats(rows, "v").has_value());
    REQUIRE_FALSE(column_stats({}, "v").has_value());
}

// ===== Builder =====

TEST_CASE("build_context exposes column facts", "[context][builder]") {
    auto ctx = build_context(sales_column(), sales_rows());

    REQUIRE(ctx.find("column_name")->as_text() == "Sales");
    REQUIRE(ctx.find("original_label")->as_text() == "Sales");
    REQUIRE(ctx.find("key")->as_text() == "sales");
    REQUIRE(ctx.find("data_type")->as_text() == "NUMERIC");
    REQUIRE(ctx.find("row_count")->as_number() == 3);
    REQUIRE(ctx.find("is_metric")->as_bool());
    REQUIRE_FALSE(ctx.find("is_percent_metric")->as_bool());
    REQUIRE(ctx.find("is_numeric")->as_bool());
    REQUIRE(ctx.find("first_value")->as_number() == 10);
    REQUIRE(ctx.find("last_value")->as_number() == 50);
    REQUIRE(ctx.find("first_row")->kind() == Value::Kind::Record);
    REQUIRE(find_field(ctx.find("last_row")->as_record(), "region")->as_text() == "east");
}

TEST_CASE("build_context statistics", "[context][builder]") {
    auto ctx = build_context(sales_column(), sales_rows());
    REQUIRE(ctx.find("min")->as_number() == 10);
    REQUIRE(ctx.find("max")->as_number() == 999);
    REQUIRE(ctx.find("sum")->as_number() == 1059);
    REQUIRE(ctx.find("count")->as_number() == 3);
    REQUIRE(ctx.contains("avg"));
}

TEST_CASE("build_context with no rows", "[context][builder]") {
    auto ctx = build_context(sales_column(), {});
    REQUIRE(ctx.find("row_count")->as_number() == 0);
    REQUIRE(ctx.find("first_row")->as_record().empty());
    REQUIRE(ctx.find("last_row")->as_record().empty());
    REQUIRE(ctx.find("first_value")->is_absent());
    REQUIRE_FALSE(ctx.contains("sum"));
    REQUIRE_FALSE(ctx.contains("avg"));
    REQUIRE_FALSE(ctx.contains("min"));
    REQUIRE_FALSE(ctx.contains("max"));
    REQUIRE_FALSE(ctx.contains("count"));
}

TEST_CASE("original_label defaults to the label", "[context][builder]") {
    auto col = sales_column();
    col.original_label = "SUM(sales)";
    auto ctx = build_context(col, {});
    REQUIRE(ctx.find("original_label")->as_text() == "SUM(sales)");
    REQUIRE(ctx.find("column_name")->as_text() == "Sales");
}

TEST_CASE("metrics only with include_metrics", "[context][builder]") {
    std::vector<std::string> metrics = {"SUM(sell_in)", "COUNT(*)"};

    auto without = build_context(sales_column(), {}, {}, metrics);
    REQUIRE_FALSE(without.contains("metrics"));
    REQUIRE_FALSE(without.contains("metric_count"));

    ContextOptions opts;
    opts.include_metrics = true;
    auto with = build_context(sales_column(), {}, {}, metrics, opts);
    REQUIRE(with.find("metric_count")->as_number() == 2);
    REQUIRE(with.find("metrics")->as_list().size() == 2);
    REQUIRE(with.find("metrics")->as_list()[0].as_text() == "SUM(sell_in)");
}

TEST_CASE("auxiliary values join the namespace", "[context][aux]") {
    Record aux{{"MAX(anio_id)", 2024}, {"period", "Q1"}};
    auto ctx = build_context(sales_column(), sales_rows(), aux);
    REQUIRE(ctx.find("MAX(anio_id)")->as_number() == 2024);
    REQUIRE(ctx.find("period")->as_text() == "Q1");
}

TEST_CASE("auxiliary values never shadow built-in names", "[context][aux]") {
    CaptureSink sink;
    log::Logger logger(sink);

    Record aux{{"row_count", 77}, {"column_name", "Hijacked"}, {"sum", 5}};
    auto ctx = build_context(sales_column(), {}, aux, {}, {}, logger);

    REQUIRE(ctx.find("row_count")->as_number() == 0);
    REQUIRE(ctx.find("column_name")->as_text() == "Sales");
    // Reserved even when the builder has no statistics to offer.
    REQUIRE_FALSE(ctx.contains("sum"));

    bool logged = false;
    for (const auto& line : sink.lines) {
        if (line.find("'row_count' ignored") != std::string::npos) logged = true;
    }
    REQUIRE(logged);
}

TEST_CASE("first auxiliary value wins on duplicates", "[context][aux]") {
    Record aux{{"period", "Q1"}, {"period", "Q2"}};
    auto ctx = build_context(sales_column(), {}, aux);
    REQUIRE(ctx.find("period")->as_text() == "Q1");
}

TEST_CASE("reserved names include every built-in key", "[context]") {
    for (const char* name : {"column_name", "row_count", "first_row", "sum",
                             "metric_count", "is_percent_metric"}) {
        REQUIRE(is_reserved_name(name));
    }
    REQUIRE_FALSE(is_reserved_name("period"));
}
