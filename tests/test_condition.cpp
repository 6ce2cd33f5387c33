#include <catch2/catch.hpp>
#include <labelkit/lang/condition.hpp>
#include <labelkit/lang/template.hpp>
#include <string>
#include <vector>

using namespace labelkit;

static Context sample_context() {
    return Context{
        {"key", "SUM(sell_in)"},
        {"row_count", 0},
        {"total", 1500},
        {"ratio", 0.25},
        {"label", ""},
        {"is_metric", true},
        {"is_numeric", false},
        {"nothing", Value()},
        {"first_row", Record{{"a", 1}}},
        {"empty_row", Record{}},
        {"MAX(anio_id)", 2024},
        {"year_text", "2023"},
    };
}

// ===== Parsing =====

TEST_CASE("parse equality with single and double quotes", "[condition][parse]") {
    auto c = parse_condition("  key == 'SUM(sell_in)' ");
    REQUIRE(c.kind == ConditionKind::Equals);
    REQUIRE(c.name == "key");
    REQUIRE(c.literal == "SUM(sell_in)");

    auto d = parse_condition("key==\"x\"");
    REQUIRE(d.kind == ConditionKind::Equals);
    REQUIRE(d.literal == "x");
}

TEST_CASE("parse startswith", "[condition][parse]") {
    auto c = parse_condition("key.startswith('SUM')");
    REQUIRE(c.kind == ConditionKind::StartsWith);
    REQUIRE(c.name == "key");
    REQUIRE(c.literal == "SUM");
}

TEST_CASE("equality operator inside a startswith literal", "[condition][parse]") {
    auto c = parse_condition("key.startswith('a==b')");
    REQUIRE(c.kind == ConditionKind::StartsWith);
    REQUIRE(c.literal == "a==b");
}

TEST_CASE("parse numeric comparisons", "[condition][parse]") {
    auto c = parse_condition("row_count >= 100");
    REQUIRE(c.kind == ConditionKind::Compare);
    REQUIRE(c.op == CompareOp::Ge);
    REQUIRE(c.number == 100);

    REQUIRE(parse_condition("total > 1.5").op == CompareOp::Gt);
    REQUIRE(parse_condition("total < -3").op == CompareOp::Lt);
    REQUIRE(parse_condition("total <= 0").op == CompareOp::Le);
    REQUIRE(parse_condition("total != 0").op == CompareOp::Ne);
    REQUIRE(parse_condition("total == 0").op == CompareOp::Eq);
}

TEST_CASE("parse not-equals with a text literal", "[condition][parse]") {
    auto c = parse_condition("key != 'x'");
    REQUIRE(c.kind == ConditionKind::NotEquals);
    REQUIRE(c.literal == "x");
}

TEST_CASE("parse bare names", "[condition][parse]") {
    REQUIRE(parse_condition("is_metric").kind == ConditionKind::Truthy);
    auto c = parse_condition(" MAX(anio_id) ");
    REQUIRE(c.kind == ConditionKind::Truthy);
    REQUIRE(c.name == "MAX(anio_id)");
}

TEST_CASE("empty condition is invalid", "[condition][parse]") {
    REQUIRE(parse_condition("").kind == ConditionKind::Invalid);
    REQUIRE(parse_condition("   ").kind == ConditionKind::Invalid);
}

// ===== Evaluation =====

TEST_CASE("equality compares the plain string form", "[condition]") {
    auto ctx = sample_context();
    REQUIRE(evaluate_condition("row_count == '0'", ctx));
    REQUIRE(evaluate_condition("total == '1500'", ctx));
    REQUIRE_FALSE(evaluate_condition("total == '1,500'", ctx));
    REQUIRE(evaluate_condition("is_metric == 'true'", ctx));
    REQUIRE(evaluate_condition("key == \"SUM(sell_in)\"", ctx));
    REQUIRE_FALSE(evaluate_condition("key == 'sum(sell_in)'", ctx));
    REQUIRE(evaluate_condition("MAX(anio_id) == '2024'", ctx));
}

TEST_CASE("equality against unknown names is false", "[condition]") {
    auto ctx = sample_context();
    REQUIRE_FALSE(evaluate_condition("missing == 'x'", ctx));
    REQUIRE_FALSE(evaluate_condition("missing == ''", ctx));
}

TEST_CASE("empty literals do not form equality or startswith", "[condition][parse]") {
    auto eq = parse_condition("nothing == ''");
    REQUIRE(eq.kind == ConditionKind::Truthy);
    REQUIRE(eq.name == "nothing == ''");
    REQUIRE(parse_condition("key.startswith('')").kind == ConditionKind::Truthy);

    auto ctx = sample_context();
    REQUIRE_FALSE(evaluate_condition("nothing == ''", ctx));
    REQUIRE_FALSE(evaluate_condition("key.startswith('')", ctx));
    REQUIRE(evaluate_condition("nothing != 'x'", ctx));
}

TEST_CASE("equality on small fractions uses plain decimals", "[condition]") {
    Context ctx{{"v", 0.000001}, {"w", 0.00005}};
    REQUIRE(evaluate_condition("v == '0.000001'", ctx));
    REQUIRE(evaluate_condition("w == '0.00005'", ctx));
    REQUIRE(evaluate_condition("v.startswith('0.0000')", ctx));
    REQUIRE(render("{% if v == '0.000001' %}eq{% else %}ne{% endif %}", ctx) == "eq");
}

TEST_CASE("operator names", "[condition]") {
    REQUIRE(std::string(compare_op_name(CompareOp::Ge)) == ">=");
    REQUIRE(std::string(compare_op_name(CompareOp::Ne)) == "!=");
    REQUIRE(std::string(condition_kind_name(ConditionKind::StartsWith)) == "startswith");
}

TEST_CASE("startswith", "[condition]") {
    auto ctx = sample_context();
    REQUIRE(evaluate_condition("key.startswith('SUM')", ctx));
    REQUIRE(evaluate_condition("key.startswith(\"SUM(\")", ctx));
    REQUIRE_FALSE(evaluate_condition("key.startswith('AVG')", ctx));
    REQUIRE_FALSE(evaluate_condition("missing.startswith('a')", ctx));
    REQUIRE_FALSE(evaluate_condition("missing.startswith('')", ctx));
    REQUIRE(evaluate_condition("total.startswith('15')", ctx));
}

TEST_CASE("bare name truthiness", "[condition]") {
    auto ctx = sample_context();
    REQUIRE(evaluate_condition("is_metric", ctx));
    REQUIRE(evaluate_condition("total", ctx));
    REQUIRE(evaluate_condition("key", ctx));
    REQUIRE(evaluate_condition("first_row", ctx));
    REQUIRE(evaluate_condition("empty_row", ctx));

    REQUIRE_FALSE(evaluate_condition("is_numeric", ctx));
    REQUIRE_FALSE(evaluate_condition("row_count", ctx));
    REQUIRE_FALSE(evaluate_condition("label", ctx));
    REQUIRE_FALSE(evaluate_condition("nothing", ctx));
    REQUIRE_FALSE(evaluate_condition("unknown_name", ctx));
}

TEST_CASE("numeric comparisons", "[condition]") {
    auto ctx = sample_context();
    REQUIRE(evaluate_condition("total > 1000", ctx));
    REQUIRE(evaluate_condition("total >= 1500", ctx));
    REQUIRE_FALSE(evaluate_condition("total < 1500", ctx));
    REQUIRE(evaluate_condition("ratio <= 0.25", ctx));
    REQUIRE(evaluate_condition("row_count == 0", ctx));
    REQUIRE(evaluate_condition("row_count != 1", ctx));
    REQUIRE(evaluate_condition("year_text < 2024", ctx));
}

TEST_CASE("numeric comparisons on non-numbers are false", "[condition]") {
    auto ctx = sample_context();
    REQUIRE_FALSE(evaluate_condition("key > 0", ctx));
    REQUIRE_FALSE(evaluate_condition("missing > 0", ctx));
    REQUIRE_FALSE(evaluate_condition("nothing < 1", ctx));
    REQUIRE_FALSE(evaluate_condition("is_metric > 0", ctx));
}

TEST_CASE("not-equals with text", "[condition]") {
    auto ctx = sample_context();
    REQUIRE(evaluate_condition("key != 'x'", ctx));
    REQUIRE_FALSE(evaluate_condition("key != 'SUM(sell_in)'", ctx));
    REQUIRE(evaluate_condition("missing != 'x'", ctx));
}

TEST_CASE("malformed conditions are false", "[condition]") {
    auto ctx = sample_context();
    REQUIRE_FALSE(evaluate_condition("", ctx));
    REQUIRE_FALSE(evaluate_condition("total > many", ctx));
    REQUIRE_FALSE(evaluate_condition("is_metric and total", ctx));
    REQUIRE_FALSE(evaluate_condition("== 'x'", ctx));
    REQUIRE_FALSE(evaluate_condition("key == 'unterminated", ctx));
    REQUIRE_FALSE(evaluate_condition("key.startswith(SUM)", ctx));
}

TEST_CASE("malformed condition is reported to the logger", "[condition]") {
    struct CaptureSink : log::Sink {
        std::vector<std::string> lines;
        void write(log::Level, const std::string& m) override { lines.push_back(m); }
    } sink;
    log::Logger logger(sink);

    REQUIRE_FALSE(evaluate_condition("   ", sample_context(), logger));
    REQUIRE(sink.lines.size() == 1);
    REQUIRE(sink.lines[0].find("malformed condition") != std::string::npos);
}

TEST_CASE("parsed conditions are reusable across contexts", "[condition]") {
    auto cond = parse_condition("row_count > 10");
    Context small{{"row_count", 3}};
    Context large{{"row_count", 30}};
    REQUIRE_FALSE(evaluate(cond, small));
    REQUIRE(evaluate(cond, large));
    REQUIRE(evaluate(cond, large));
}
