#include <labelkit/rows.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace labelkit {

using json = nlohmann::ordered_json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Value from_json(const json& node);

static Record object_to_record(const json& obj) {
    Record rec;
    for (const auto& [field, cell] : obj.items()) {
        rec.emplace_back(field, from_json(cell));
    }
    return rec;
}

static Value from_json(const json& node) {
    switch (node.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return Value::absent();
        case json::value_t::boolean:
            return Value(node.get<bool>());
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return Value(node.get<double>());
        case json::value_t::string:
            return Value(node.get<std::string>());
        case json::value_t::object:
            return Value(object_to_record(node));
        case json::value_t::array: {
            List list;
            for (const auto& item : node) {
                list.push_back(from_json(item));
            }
            return Value(std::move(list));
        }
        case json::value_t::binary:
            return Value::absent();
    }
    return Value::absent();
}

static Result<json> parse_document(const std::string& json_text, const char* what) {
    try {
        return Result<json>::ok(json::parse(json_text));
    } catch (const json::parse_error& e) {
        return LabelError{LabelError::Parse,
            std::string(what) + " JSON parse error: " + e.what()};
    }
}

static Result<std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return LabelError{LabelError::IO, "cannot open file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Result<std::string>::ok(ss.str());
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<std::vector<Record>> parse_rows(const std::string& json_text) {
    auto doc = parse_document(json_text, "rows");
    if (doc.is_err()) return std::move(doc).error();

    const json& arr = doc.value();
    if (!arr.is_array()) {
        return LabelError{LabelError::Parse,
            "rows must be a JSON array of objects"};
    }

    std::vector<Record> rows;
    rows.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr[i].is_object()) {
            return LabelError{LabelError::Parse,
                "row " + std::to_string(i) + " is not a JSON object"};
        }
        rows.push_back(object_to_record(arr[i]));
    }
    return Result<std::vector<Record>>::ok(std::move(rows));
}

Result<std::vector<Record>> load_rows(const std::string& path) {
    auto text = read_file(path);
    if (text.is_err()) return std::move(text).error();
    auto rows = parse_rows(text.value());
    if (rows.is_err() && rows.error().file.empty()) rows.error().file = path;
    return rows;
}

Result<Record> parse_aux(const std::string& json_text) {
    auto doc = parse_document(json_text, "aux");
    if (doc.is_err()) return std::move(doc).error();

    if (!doc.value().is_object()) {
        return LabelError{LabelError::Parse,
            "auxiliary values must be a JSON object"};
    }
    return Result<Record>::ok(object_to_record(doc.value()));
}

Result<Record> load_aux(const std::string& path) {
    auto text = read_file(path);
    if (text.is_err()) return std::move(text).error();
    auto aux = parse_aux(text.value());
    if (aux.is_err() && aux.error().file.empty()) aux.error().file = path;
    return aux;
}

Result<std::vector<std::string>> parse_metrics(const std::string& json_text) {
    auto doc = parse_document(json_text, "metrics");
    if (doc.is_err()) return std::move(doc).error();

    const json& arr = doc.value();
    if (!arr.is_array()) {
        return LabelError{LabelError::Parse, "metrics must be a JSON array"};
    }

    std::vector<std::string> ids;
    for (const auto& item : arr) {
        if (!item.is_string()) {
            return LabelError{LabelError::Parse,
                "metric identifiers must be strings"};
        }
        ids.push_back(item.get<std::string>());
    }
    return Result<std::vector<std::string>>::ok(std::move(ids));
}

} // namespace labelkit
