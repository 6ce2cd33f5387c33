#pragma once

#include <string>
#include <unordered_map>

namespace labelkit {

// Human-friendly label for a raw field identifier. Understands the
// aggregate notation FUNC(field) for SUM, COUNT, AVG, MAX and MIN.
//   transform_column_name("SUM(sell_in)") == "Total Sell In"
//   transform_column_name("anio_id")      == "Año"
//   transform_column_name("region")       == "region"
std::string transform_column_name(const std::string& raw);

// Built-in identifier -> label table.
const std::unordered_map<std::string, std::string>& builtin_aliases();

// Built-in table plus user aliases; user entries win.
class NameTable {
public:
    NameTable() = default;
    explicit NameTable(std::unordered_map<std::string, std::string> aliases)
        : aliases_(std::move(aliases)) {}

    void add(const std::string& identifier, const std::string& label);

    // Label for a bare identifier; the identifier itself when unknown.
    std::string lookup(const std::string& identifier) const;

    std::string transform(const std::string& raw) const;

private:
    std::unordered_map<std::string, std::string> aliases_;
};

} // namespace labelkit
