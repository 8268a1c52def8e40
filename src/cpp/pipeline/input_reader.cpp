#include "input_reader.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace kvload {

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

size_t InputReader::skip_bom(const std::string& content) {
    if (content.size() >= 3 &&
        static_cast<unsigned char>(content[0]) == 0xEF &&
        static_cast<unsigned char>(content[1]) == 0xBB &&
        static_cast<unsigned char>(content[2]) == 0xBF) {
        return 3;
    }
    return 0;
}

InputFormat InputReader::detect_format(const std::string& content) {
    size_t pos = content.find_first_not_of(" \t\r\n", skip_bom(content));
    if (pos != std::string::npos && (content[pos] == '[' || content[pos] == '{')) {
        return InputFormat::STRUCTURED;
    }
    return InputFormat::TABULAR;
}

// ============================================================================
// CSV
// ============================================================================

std::vector<std::vector<std::string>> InputReader::parse_csv_records(const std::string& content) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;   // current field started with a quote

    auto end_field = [&]() {
        fields.push_back(std::move(field));
        field.clear();
        field_quoted = false;
    };
    auto end_record = [&]() {
        end_field();
        records.push_back(std::move(fields));
        fields.clear();
    };

    const size_t n = content.size();
    for (size_t i = skip_bom(content); i < n; ++i) {
        char c = content[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < n && content[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"' && field.empty() && !field_quoted) {
            in_quotes = true;
            field_quoted = true;
        } else if (c == ',') {
            end_field();
        } else if (c == '\r' && i + 1 < n && content[i + 1] == '\n') {
            // CRLF: the '\n' ends the record
        } else if (c == '\n') {
            end_record();
        } else {
            field += c;
        }
    }

    if (in_quotes) {
        LOG_WRN("[input] CSV ends inside a quoted field -- keeping the partial record");
    }
    if (!field.empty() || !fields.empty() || field_quoted) {
        end_record();
    }
    return records;
}

std::vector<RawRow> InputReader::parse_csv_rows(const std::string& content) {
    std::vector<RawRow> rows;
    auto records = parse_csv_records(content);
    if (records.empty()) return rows;

    const auto& header = records.front();
    rows.reserve(records.size() - 1);

    for (size_t r = 1; r < records.size(); ++r) {
        const auto& rec = records[r];
        // Blank line
        if (rec.size() == 1 && rec[0].empty()) continue;

        if (rec.size() > header.size()) {
            LOG_DBG("[input] Row %zu has %zu fields, header has %zu -- extra fields ignored",
                r, rec.size(), header.size());
        }

        RawRow row;
        size_t count = std::min(rec.size(), header.size());
        for (size_t i = 0; i < count; ++i) {
            row[header[i]] = rec[i];
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

// ============================================================================
// JSON
// ============================================================================

bool InputReader::parse_structured(const std::string& content,
                                   std::vector<nlohmann::json>& out, std::string& error) {
    auto j = nlohmann::json::parse(content.begin() + static_cast<std::ptrdiff_t>(skip_bom(content)),
                                   content.end(), nullptr, false);
    if (j.is_discarded()) {
        error = "Input looks like JSON but does not parse";
        return false;
    }

    const nlohmann::json* list = nullptr;
    if (j.is_array()) {
        list = &j;
    } else if (j.is_object() && j.contains("problems") && j["problems"].is_array()) {
        list = &j["problems"];
    } else {
        error = "Invalid JSON format. Expected list or object with 'problems' key.";
        return false;
    }

    out.assign(list->begin(), list->end());
    return true;
}

// ============================================================================
// Loading
// ============================================================================

LoadedInput InputReader::load_content(const std::string& content, const std::string& path) {
    LoadedInput in;
    in.format = detect_format(content);

    if (!path.empty()) {
        if (in.format == InputFormat::TABULAR && ends_with(path, ".json")) {
            LOG_WRN("[input] %s is named .json but its content is not JSON -- reading as CSV",
                path.c_str());
        } else if (in.format == InputFormat::STRUCTURED && ends_with(path, ".csv")) {
            LOG_WRN("[input] %s is named .csv but its content is JSON -- reading as JSON",
                path.c_str());
        }
    }

    if (in.format == InputFormat::STRUCTURED) {
        if (!parse_structured(content, in.objects, in.error)) {
            in.objects.clear();
        }
    } else {
        in.rows = parse_csv_rows(content);
    }
    return in;
}

LoadedInput InputReader::load(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        LoadedInput in;
        in.error = "Cannot open input file " + path;
        return in;
    }

    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        LoadedInput in;
        in.error = "Read error on input file " + path;
        return in;
    }

    LoadedInput in = load_content(ss.str(), path);
    if (in.error.empty()) {
        LOG_INF("[input] %s: %s, %zu rows", path.c_str(), input_format_str(in.format), in.size());
    }
    return in;
}

} // namespace kvload
