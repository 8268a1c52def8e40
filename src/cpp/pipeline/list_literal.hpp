#pragma once
// Best-effort parser for list literals embedded in CSV cells, e.g.
//   ["Array", "Hash Table"]      -> {Array, Hash Table}
//   ['Use a map', "a, b, or c"]  -> {Use a map, a, b, or c}
//
// Commas inside quotes do not split. Elements are trimmed and lose one pair of
// matching quotes; backslash escapes inside quotes are honored; empty elements
// are dropped. Surrounding brackets are optional. An unmatched '[' or an
// unterminated quote makes the whole cell unparsable, which yields an empty
// list -- list fields never invalidate a row.
#include <string>
#include <vector>

namespace kvload {

std::vector<std::string> parse_list_literal(const std::string& text);

// Whitespace trim (space, tab, CR, LF)
std::string trim_copy(const std::string& s);

} // namespace kvload
