#include "source_reader.hpp"
#include "incidex/errors.hpp"
#include <fstream>
#include <sstream>

namespace incidex::engine {

    namespace {

        const char* const kContainerKeys[] = {"incidencias", "data", "items", "incidents", "records"};

        std::string read_all(const std::filesystem::path& path) {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open()) {
                throw Error(ErrorKind::SourceNotFound, "cannot open " + path.string());
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            return buffer.str();
        }

        const nlohmann::ordered_json* first_list(const nlohmann::ordered_json& node) {
            if (!node.is_object()) return nullptr;
            for (const auto& [key, value] : node.items()) {
                if (value.is_array()) return &value;
            }
            for (const auto& [key, value] : node.items()) {
                if (auto* found = first_list(value)) return found;
            }
            return nullptr;
        }

    }

    Table parse_delimited(const std::string& content, char delimiter) {
        Table table;
        std::vector<std::vector<std::string>> records;
        std::vector<std::string> record;
        std::string field;
        bool in_quotes = false;
        bool field_started = false;

        size_t i = 0;
        if (content.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;

        auto end_field = [&]() {
            record.push_back(field);
            field.clear();
            field_started = false;
        };
        auto end_record = [&]() {
            end_field();
            bool blank = record.size() == 1 && record[0].empty();
            if (!blank) records.push_back(std::move(record));
            record.clear();
        };

        for (; i < content.size(); ++i) {
            char c = content[i];
            if (in_quotes) {
                if (c == '"') {
                    if (i + 1 < content.size() && content[i + 1] == '"') {
                        field.push_back('"');
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    field.push_back(c);
                }
            } else if (c == '"' && !field_started) {
                in_quotes = true;
                field_started = true;
            } else if (c == delimiter) {
                end_field();
            } else if (c == '\r') {
                if (i + 1 < content.size() && content[i + 1] == '\n') ++i;
                end_record();
            } else if (c == '\n') {
                end_record();
            } else {
                field.push_back(c);
                field_started = true;
            }
        }
        if (field_started || !field.empty() || !record.empty()) end_record();

        if (records.empty()) return table;
        table.columns = std::move(records.front());
        for (size_t r = 1; r < records.size(); ++r) {
            auto& row = records[r];
            row.resize(table.columns.size());
            table.rows.push_back(std::move(row));
        }
        return table;
    }

    Table read_delimited(const std::filesystem::path& path, char delimiter) {
        return parse_delimited(read_all(path), delimiter);
    }

    nlohmann::ordered_json read_document(const std::filesystem::path& path) {
        std::string content = read_all(path);
        try {
            return nlohmann::ordered_json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw Error(ErrorKind::UnsupportedFormat, "invalid JSON in " + path.filename().string() + ": " + e.what());
        }
    }

    const nlohmann::ordered_json* find_item_list(const nlohmann::ordered_json& document) {
        if (document.is_array()) return &document;
        if (!document.is_object()) return nullptr;

        for (const char* key : kContainerKeys) {
            auto it = document.find(key);
            if (it != document.end() && it->is_array()) return &*it;
        }
        return first_list(document);
    }

    Metadata flatten_item(const nlohmann::ordered_json& item) {
        Metadata fields;
        if (!item.is_object()) return fields;
        for (const auto& [key, value] : item.items()) {
            if (value.is_null()) continue;
            fields[key] = value.is_string() ? value.get<std::string>()
                                            : value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
        return fields;
    }

}
