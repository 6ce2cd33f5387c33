#pragma once

#include <labelkit/context.hpp>
#include <labelkit/log.hpp>
#include <string>
#include <string_view>

namespace labelkit {

// Condition forms, in the order the parser tries them:
//   name == 'text'            string form of the value equals the literal
//   name.startswith('text')   string form starts with the literal
//   name != 'text'            string form differs from the literal
//   name OP number            numeric comparison, OP in == != > >= < <=
//   name                      truthiness
// The == and startswith literals must be non-empty; `x == ''` falls through
// to a lookup of the whole text, which is false. An empty condition is
// Invalid and evaluates to false.
enum class ConditionKind {
    Equals,
    StartsWith,
    NotEquals,
    Compare,
    Truthy,
    Invalid
};

enum class CompareOp { Eq, Ne, Gt, Ge, Lt, Le };

struct Condition {
    ConditionKind kind = ConditionKind::Invalid;
    std::string name;
    std::string literal;                 // Equals, StartsWith, NotEquals
    CompareOp op = CompareOp::Eq;        // Compare
    double number = 0;                   // Compare
    std::string source;                  // trimmed condition text
};

Condition parse_condition(std::string_view text);

const char* condition_kind_name(ConditionKind k);
const char* compare_op_name(CompareOp op);

// Never throws: failures are logged and evaluate to false.
bool evaluate(const Condition& cond, const Context& ctx,
              const log::Logger& logger = {});

bool evaluate_condition(std::string_view text, const Context& ctx,
                        const log::Logger& logger = {});

} // namespace labelkit
