#include <labelkit/lang/condition.hpp>
#include <labelkit/text.hpp>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <exception>

namespace labelkit {

const char* condition_kind_name(ConditionKind k) {
    switch (k) {
        case ConditionKind::Equals:     return "equals";
        case ConditionKind::StartsWith: return "startswith";
        case ConditionKind::NotEquals:  return "not-equals";
        case ConditionKind::Compare:    return "compare";
        case ConditionKind::Truthy:     return "truthy";
        case ConditionKind::Invalid:    return "invalid";
    }
    return "unknown";
}

const char* compare_op_name(CompareOp op) {
    switch (op) {
        case CompareOp::Eq: return "==";
        case CompareOp::Ne: return "!=";
        case CompareOp::Gt: return ">";
        case CompareOp::Ge: return ">=";
        case CompareOp::Lt: return "<";
        case CompareOp::Le: return "<=";
    }
    return "?";
}

// ---------------------------------------------------------------------------
// Parsing helpers
// ---------------------------------------------------------------------------

namespace {

bool is_quote(char c) { return c == '\'' || c == '"'; }

// 'text' or "text" spanning all of `s`.
bool parse_quoted(std::string_view s, std::string& out) {
    if (s.size() < 2 || !is_quote(s.front()) || s.back() != s.front()) return false;
    out.assign(s.substr(1, s.size() - 2));
    return true;
}

bool parse_number(std::string_view s, double& out) {
    if (s.empty()) return false;
    char c = s.front();
    if (!std::isdigit(static_cast<unsigned char>(c)) &&
        c != '-' && c != '+' && c != '.') {
        return false;
    }
    std::string buf(s);
    char* end = nullptr;
    out = std::strtod(buf.c_str(), &end);
    return end == buf.c_str() + buf.size() && !std::isnan(out);
}

// Location of the first binary operator in `s`, scanning left to right and
// skipping quoted text.
struct OpMatch {
    size_t pos = std::string_view::npos;
    size_t len = 0;
    CompareOp op = CompareOp::Eq;
};

OpMatch find_operator(std::string_view s) {
    char quote = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (is_quote(c)) {
            quote = c;
            continue;
        }
        char next = (i + 1 < s.size()) ? s[i + 1] : '\0';
        if (c == '=' && next == '=') return {i, 2, CompareOp::Eq};
        if (c == '!' && next == '=') return {i, 2, CompareOp::Ne};
        if (c == '>' && next == '=') return {i, 2, CompareOp::Ge};
        if (c == '<' && next == '=') return {i, 2, CompareOp::Le};
        if (c == '>') return {i, 1, CompareOp::Gt};
        if (c == '<') return {i, 1, CompareOp::Lt};
    }
    return {};
}

bool parse_equality(std::string_view s, Condition& cond) {
    auto eq = s.find("==");
    if (eq == std::string_view::npos) return false;
    auto name = trim_view(s.substr(0, eq));
    if (name.empty()) return false;
    if (!parse_quoted(trim_view(s.substr(eq + 2)), cond.literal)) return false;
    if (cond.literal.empty()) return false;
    cond.kind = ConditionKind::Equals;
    cond.name = std::string(name);
    return true;
}

bool parse_startswith(std::string_view s, Condition& cond) {
    static constexpr std::string_view marker = ".startswith(";
    auto at = s.find(marker);
    if (at == std::string_view::npos) return false;
    auto name = trim_view(s.substr(0, at));
    if (name.empty()) return false;

    auto args = s.substr(at + marker.size());
    if (args.empty() || args.back() != ')') return false;
    if (!parse_quoted(trim_view(args.substr(0, args.size() - 1)), cond.literal) ||
        cond.literal.empty()) {
        return false;
    }
    cond.kind = ConditionKind::StartsWith;
    cond.name = std::string(name);
    return true;
}

bool parse_comparison(std::string_view s, Condition& cond) {
    auto m = find_operator(s);
    if (m.pos == std::string_view::npos) return false;
    auto name = trim_view(s.substr(0, m.pos));
    auto rhs = trim_view(s.substr(m.pos + m.len));
    if (name.empty() || rhs.empty()) return false;

    if (m.op == CompareOp::Ne && parse_quoted(rhs, cond.literal)) {
        cond.kind = ConditionKind::NotEquals;
        cond.name = std::string(name);
        return true;
    }
    if (!parse_number(rhs, cond.number)) return false;
    cond.kind = ConditionKind::Compare;
    cond.op = m.op;
    cond.name = std::string(name);
    return true;
}

// Any remaining text is taken as a context key; keys may contain spaces
// or parentheses ("MAX(anio_id)").
void parse_bare_name(std::string_view s, Condition& cond) {
    cond.kind = ConditionKind::Truthy;
    cond.name = std::string(s);
}

// Numeric view of a value: numbers as-is, text when it parses fully.
bool numeric_value(const Value& v, double& out) {
    if (v.is_number()) {
        out = v.as_number();
        return !std::isnan(out);
    }
    if (v.is_text()) return parse_number(trim_view(v.as_text()), out);
    return false;
}

bool compare(double lhs, CompareOp op, double rhs) {
    switch (op) {
        case CompareOp::Eq: return lhs == rhs;
        case CompareOp::Ne: return lhs != rhs;
        case CompareOp::Gt: return lhs > rhs;
        case CompareOp::Ge: return lhs >= rhs;
        case CompareOp::Lt: return lhs < rhs;
        case CompareOp::Le: return lhs <= rhs;
    }
    return false;
}

} // namespace

Condition parse_condition(std::string_view text) {
    Condition cond;
    auto s = trim_view(text);
    cond.source = std::string(s);
    if (s.empty()) return cond;

    if (parse_equality(s, cond)) return cond;
    if (parse_startswith(s, cond)) return cond;
    if (parse_comparison(s, cond)) return cond;
    parse_bare_name(s, cond);
    return cond;
}

// ---------------------------------------------------------------------------
// Evaluation
// ---------------------------------------------------------------------------

static bool evaluate_unchecked(const Condition& cond, const Context& ctx) {
    const Value* value = ctx.find(cond.name);

    switch (cond.kind) {
        case ConditionKind::Equals:
            return value && value->str() == cond.literal;
        case ConditionKind::NotEquals:
            return !value || value->str() != cond.literal;
        case ConditionKind::StartsWith: {
            std::string text = value ? value->str() : std::string();
            return text.compare(0, cond.literal.size(), cond.literal) == 0;
        }
        case ConditionKind::Compare: {
            double lhs = 0;
            if (!value || !numeric_value(*value, lhs)) return false;
            return compare(lhs, cond.op, cond.number);
        }
        case ConditionKind::Truthy:
            return value && value->truthy();
        case ConditionKind::Invalid:
            return false;
    }
    return false;
}

bool evaluate(const Condition& cond, const Context& ctx, const log::Logger& logger) {
    if (cond.kind == ConditionKind::Invalid) {
        logger.warn("malformed condition '%s' treated as false", cond.source.c_str());
        return false;
    }
    try {
        bool result = evaluate_unchecked(cond, ctx);
        logger.trace("condition '%s' (%s) -> %s", cond.source.c_str(),
                     condition_kind_name(cond.kind), result ? "true" : "false");
        return result;
    } catch (const std::exception& e) {
        logger.warn("condition '%s' failed: %s", cond.source.c_str(), e.what());
        return false;
    }
}

bool evaluate_condition(std::string_view text, const Context& ctx,
                        const log::Logger& logger) {
    return evaluate(parse_condition(text), ctx, logger);
}

} // namespace labelkit
