#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace labelkit {

class Value;

// One data row: field name -> cell, in column order.
using Record = std::vector<std::pair<std::string, Value>>;
using List = std::vector<Value>;

// A context value. The set of kinds is closed; every formatting rule below
// switches over it exhaustively.
class Value {
public:
    enum class Kind { Absent, Bool, Number, Text, Record, List };

    Value() = default;
    Value(bool b) : data_(b) {}
    Value(int n) : data_(static_cast<double>(n)) {}
    Value(double n) : data_(n) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(Record r) : data_(std::move(r)) {}
    Value(List l) : data_(std::move(l)) {}

    static Value absent() { return Value(); }

    Kind kind() const;
    bool is_absent() const { return kind() == Kind::Absent; }
    bool is_number() const { return kind() == Kind::Number; }
    bool is_text() const { return kind() == Kind::Text; }

    bool as_bool() const { return std::get<bool>(data_); }
    double as_number() const { return std::get<double>(data_); }
    const std::string& as_text() const { return std::get<std::string>(data_); }
    const Record& as_record() const { return std::get<Record>(data_); }
    const List& as_list() const { return std::get<List>(data_); }

    // Plain string form used by conditions: numbers without grouping,
    // absent as empty text.
    std::string str() const;

    // Interpolation form: grouped numbers, absent as empty text, records
    // and lists as compact JSON.
    std::string display() const;

    // Absent, false, 0, NaN and "" are falsy.
    bool truthy() const;

    bool operator==(const Value& o) const { return data_ == o.data_; }
    bool operator!=(const Value& o) const { return !(*this == o); }

private:
    std::variant<std::monostate, bool, double, std::string, Record, List> data_;
};

const char* kind_name(Value::Kind k);

// Field lookup in a row; nullptr when the row has no such field.
const Value* find_field(const Record& row, const std::string& name);

// en-US style: "1,234.568" (at most three fraction digits).
std::string format_number(double n);

// Shortest decimal that reads back exactly: "1234", "2.5", "0.000001".
// Exponent form only below 1e-6 or from 1e21 up ("1e-7", "1e+21").
std::string plain_number(double n);

// Overlay `from` onto `into`: fields present in both take the value from
// `from`, new fields are appended in order.
void merge_fields(Record& into, const Record& from);

// Compact JSON, field order preserved.
std::string to_json(const Value& v);

} // namespace labelkit
