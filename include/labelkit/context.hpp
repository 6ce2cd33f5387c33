#pragma once

#include <labelkit/log.hpp>
#include <labelkit/value.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace labelkit {

// Column metadata as delivered by the query layer.
struct ColumnDescriptor {
    std::string label;           // display label
    std::string original_label;  // label before user renaming; empty means `label`
    std::string key;             // field name of the column inside each row
    std::string data_type;       // e.g. "NUMERIC", "STRING", "TEMPORAL"
    bool is_numeric = false;
    bool is_metric = false;
    bool is_percent_metric = false;
};

struct ColumnStats {
    double sum = 0;
    double avg = 0;
    double min = 0;
    double max = 0;
    size_t count = 0;
};

// Statistics over the non-null numeric cells of column `key`.
// std::nullopt when the column has no such cell.
std::optional<ColumnStats> column_stats(const std::vector<Record>& rows,
                                        const std::string& key);

struct ContextOptions {
    bool include_metrics = false;
};

// Flat named-value bag for one render call. Keeps insertion order.
class Context {
public:
    using Entry = std::pair<std::string, Value>;

    Context() = default;
    Context(std::initializer_list<Entry> entries);

    // Insert or replace.
    void set(const std::string& name, Value v);

    // Insert only when `name` is not present yet. Returns true if inserted.
    bool insert(const std::string& name, Value v);

    const Value* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

// Names the builder owns. Auxiliary values never shadow these, whether or
// not the builder emits them for a given column.
const std::vector<std::string>& reserved_names();
bool is_reserved_name(const std::string& name);

// Assemble the context for one column: built-in facts first, then the
// auxiliary values whose names are not reserved.
Context build_context(const ColumnDescriptor& column,
                      const std::vector<Record>& rows,
                      const Record& aux = {},
                      const std::vector<std::string>& metrics = {},
                      const ContextOptions& options = {},
                      const log::Logger& logger = {});

} // namespace labelkit
