#include <labelkit/names.hpp>
#include <cctype>

namespace labelkit {

const std::unordered_map<std::string, std::string>& builtin_aliases() {
    static const std::unordered_map<std::string, std::string> table = {
        {"jefe_marca", "Jefe Marca"},
        {"sell_in",    "Sell In"},
        {"anio_id",    "A\xC3\xB1o"},
        {"mes_id",     "Mes"},
        {"fecha",      "Fecha"},
    };
    return table;
}

static const char* aggregate_prefix(const std::string& func) {
    std::string upper;
    upper.reserve(func.size());
    for (char c : func) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (upper == "SUM")   return "Total";
    if (upper == "COUNT") return "Cantidad";
    if (upper == "AVG")   return "Promedio";
    if (upper == "MAX")   return "M\xC3\xA1ximo";
    if (upper == "MIN")   return "M\xC3\xADnimo";
    return nullptr;
}

// Splits "FUNC(field)" into its parts. The whole identifier must be the
// call; a line break anywhere disqualifies it.
static bool split_aggregate(const std::string& raw, const char*& prefix,
                            std::string& field) {
    if (raw.find('\n') != std::string::npos) return false;
    auto open = raw.find('(');
    if (open == std::string::npos || raw.empty() || raw.back() != ')') return false;

    prefix = aggregate_prefix(raw.substr(0, open));
    if (!prefix) return false;

    field = raw.substr(open + 1, raw.size() - open - 2);
    return true;
}

void NameTable::add(const std::string& identifier, const std::string& label) {
    aliases_[identifier] = label;
}

std::string NameTable::lookup(const std::string& identifier) const {
    auto it = aliases_.find(identifier);
    if (it != aliases_.end()) return it->second;

    const auto& builtin = builtin_aliases();
    auto bit = builtin.find(identifier);
    if (bit != builtin.end()) return bit->second;

    return identifier;
}

std::string NameTable::transform(const std::string& raw) const {
    const char* prefix = nullptr;
    std::string field;
    if (split_aggregate(raw, prefix, field)) {
        return std::string(prefix) + " " + lookup(field);
    }
    return lookup(raw);
}

std::string transform_column_name(const std::string& raw) {
    static const NameTable table;
    return table.transform(raw);
}

} // namespace labelkit
