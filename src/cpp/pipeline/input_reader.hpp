#pragma once
// =============================================================================
// Input Reader -- loads the problem dataset and decides how to interpret it
//
// Two encodings are accepted:
//   Tabular:    CSV with a header row (RFC 4180 quoting, multi-line cells)
//   Structured: JSON, either a bare array of problem objects or an object
//               whose "problems" key holds that array
//
// The content decides, not the file name: after an optional UTF-8 BOM and
// whitespace, '[' or '{' means structured. The extension is only compared to
// warn about misnamed files.
// =============================================================================

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kvload {

enum class InputFormat { TABULAR, STRUCTURED };

inline const char* input_format_str(InputFormat f) {
    switch (f) {
        case InputFormat::TABULAR:    return "tabular (csv)";
        case InputFormat::STRUCTURED: return "structured (json)";
    }
    return "??";
}

// One CSV data row: header name -> cell text. Cells missing from a short row
// are absent from the map.
using RawRow = std::map<std::string, std::string>;

struct LoadedInput {
    InputFormat format = InputFormat::TABULAR;
    std::vector<RawRow> rows;                // TABULAR
    std::vector<nlohmann::json> objects;     // STRUCTURED
    std::string error;                       // non-empty: input unusable (fatal)

    [[nodiscard]] size_t size() const {
        return format == InputFormat::TABULAR ? rows.size() : objects.size();
    }
};

class InputReader {
public:
    // Read, sniff and parse a dataset file
    static LoadedInput load(const std::string& path);

    // Same, for content already in memory (path only used for messages)
    static LoadedInput load_content(const std::string& content, const std::string& path = "");

    static InputFormat detect_format(const std::string& content);

    // Split CSV text into records of fields (quotes removed, "" unescaped)
    static std::vector<std::vector<std::string>> parse_csv_records(const std::string& content);

    // Header-mapped CSV rows; blank lines are skipped
    static std::vector<RawRow> parse_csv_rows(const std::string& content);

    // Extract the problem objects; false + error message on bad JSON or shape
    static bool parse_structured(const std::string& content,
                                 std::vector<nlohmann::json>& out, std::string& error);

private:
    static size_t skip_bom(const std::string& content);
};

} // namespace kvload
