#pragma once

#include <labelkit/result.hpp>
#include <labelkit/value.hpp>
#include <string>
#include <vector>

namespace labelkit {

// Query results arrive as JSON:
//   rows    [{"region": "north", "sales": 10}, ...]
//   aux     {"MAX(anio_id)": 2024, "period": "Q1"}
//   metrics ["SUM(sell_in)", "COUNT(*)"]
// Objects keep their field order; numbers become Number values.

Result<std::vector<Record>> parse_rows(const std::string& json_text);
Result<std::vector<Record>> load_rows(const std::string& path);

Result<Record> parse_aux(const std::string& json_text);
Result<Record> load_aux(const std::string& path);

Result<std::vector<std::string>> parse_metrics(const std::string& json_text);

} // namespace labelkit
