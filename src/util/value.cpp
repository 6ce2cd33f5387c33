#include <labelkit/value.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdint>
#include <cstdlib>

namespace labelkit {

using json = nlohmann::ordered_json;

Value::Kind Value::kind() const {
    switch (data_.index()) {
        case 0: return Kind::Absent;
        case 1: return Kind::Bool;
        case 2: return Kind::Number;
        case 3: return Kind::Text;
        case 4: return Kind::Record;
        case 5: return Kind::List;
    }
    return Kind::Absent;
}

const char* kind_name(Value::Kind k) {
    switch (k) {
        case Value::Kind::Absent: return "absent";
        case Value::Kind::Bool:   return "bool";
        case Value::Kind::Number: return "number";
        case Value::Kind::Text:   return "text";
        case Value::Kind::Record: return "record";
        case Value::Kind::List:   return "list";
    }
    return "unknown";
}

const Value* find_field(const Record& row, const std::string& name) {
    for (const auto& [field, value] : row) {
        if (field == name) return &value;
    }
    return nullptr;
}

void merge_fields(Record& into, const Record& from) {
    for (const auto& [name, value] : from) {
        auto it = std::find_if(into.begin(), into.end(),
                               [&](const auto& entry) { return entry.first == name; });
        if (it != into.end()) {
            it->second = value;
        } else {
            into.emplace_back(name, value);
        }
    }
}

// ---- Number formatting ----

static bool is_safe_integer(double n) {
    return std::isfinite(n) && n == std::floor(n) && std::fabs(n) < 9007199254740992.0;
}

static std::string group_thousands(const std::string& digits) {
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);
    size_t lead = digits.size() % 3;
    if (lead == 0) lead = 3;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i >= lead && (i - lead) % 3 == 0) out.push_back(',');
        out.push_back(digits[i]);
    }
    return out;
}

std::string format_number(double n) {
    if (std::isnan(n)) return "NaN";
    if (std::isinf(n)) return n < 0 ? "-\xE2\x88\x9E" : "\xE2\x88\x9E";

    char buf[400];
    std::snprintf(buf, sizeof(buf), "%.3f", n);
    std::string text(buf);

    std::string sign;
    if (!text.empty() && text[0] == '-') {
        sign = "-";
        text.erase(0, 1);
    }

    std::string int_part = text;
    std::string frac_part;
    auto dot = text.find('.');
    if (dot != std::string::npos) {
        int_part = text.substr(0, dot);
        frac_part = text.substr(dot + 1);
        while (!frac_part.empty() && frac_part.back() == '0') frac_part.pop_back();
    }

    std::string out = sign + group_thousands(int_part);
    if (!frac_part.empty()) {
        out += '.';
        out += frac_part;
    }
    return out;
}

std::string plain_number(double n) {
    if (std::isnan(n)) return "NaN";
    if (std::isinf(n)) return n < 0 ? "-Infinity" : "Infinity";
    if (n == 0) return "0";

    // Shortest d.ddde+XX that reads back to the same double.
    char buf[64];
    for (int precision = 0; precision <= 16; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*e", precision, n);
        if (std::strtod(buf, nullptr) == n) break;
    }

    std::string text(buf);
    std::string sign;
    if (text[0] == '-') {
        sign = "-";
        text.erase(0, 1);
    }
    auto e = text.find('e');
    int exponent = std::atoi(text.c_str() + e + 1);
    std::string digits = text.substr(0, e);
    digits.erase(std::remove(digits.begin(), digits.end(), '.'), digits.end());
    while (digits.size() > 1 && digits.back() == '0') digits.pop_back();

    // Fixed notation for 1e-6 <= |n| < 1e21, exponent form outside.
    std::string out;
    if (exponent < -6 || exponent >= 21) {
        out = digits.substr(0, 1);
        if (digits.size() > 1) out += "." + digits.substr(1);
        out += exponent < 0 ? "e-" : "e+";
        out += std::to_string(std::abs(exponent));
    } else if (exponent < 0) {
        out = "0." + std::string(static_cast<size_t>(-exponent - 1), '0') + digits;
    } else {
        size_t int_len = static_cast<size_t>(exponent) + 1;
        if (digits.size() <= int_len) {
            out = digits + std::string(int_len - digits.size(), '0');
        } else {
            out = digits.substr(0, int_len) + "." + digits.substr(int_len);
        }
    }
    return sign + out;
}

// ---- JSON ----

static json to_json_node(const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Absent:
            return nullptr;
        case Value::Kind::Bool:
            return v.as_bool();
        case Value::Kind::Number: {
            double n = v.as_number();
            if (!std::isfinite(n)) return nullptr;
            if (is_safe_integer(n)) return static_cast<std::int64_t>(n);
            return n;
        }
        case Value::Kind::Text:
            return v.as_text();
        case Value::Kind::Record: {
            json obj = json::object();
            for (const auto& [field, cell] : v.as_record()) {
                obj[field] = to_json_node(cell);
            }
            return obj;
        }
        case Value::Kind::List: {
            json arr = json::array();
            for (const auto& item : v.as_list()) {
                arr.push_back(to_json_node(item));
            }
            return arr;
        }
    }
    return nullptr;
}

std::string to_json(const Value& v) {
    // Replace invalid UTF-8 rather than throwing from dump().
    return to_json_node(v).dump(-1, ' ', false, json::error_handler_t::replace);
}

// ---- Value ----

std::string Value::str() const {
    switch (kind()) {
        case Kind::Absent: return "";
        case Kind::Bool:   return as_bool() ? "true" : "false";
        case Kind::Number: return plain_number(as_number());
        case Kind::Text:   return as_text();
        case Kind::Record:
        case Kind::List:   return to_json(*this);
    }
    return "";
}

std::string Value::display() const {
    switch (kind()) {
        case Kind::Absent: return "";
        case Kind::Bool:   return as_bool() ? "true" : "false";
        case Kind::Number: return format_number(as_number());
        case Kind::Text:   return as_text();
        case Kind::Record:
        case Kind::List:   return to_json(*this);
    }
    return "";
}

bool Value::truthy() const {
    switch (kind()) {
        case Kind::Absent: return false;
        case Kind::Bool:   return as_bool();
        case Kind::Number: return as_number() != 0 && !std::isnan(as_number());
        case Kind::Text:   return !as_text().empty();
        case Kind::Record:
        case Kind::List:   return true;
    }
    return false;
}

} // namespace labelkit
