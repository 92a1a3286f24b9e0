#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace parcelday {

std::string to_lower(std::string s);

// Strips leading/trailing whitespace.
std::string trim_copy(const std::string& s);

// Splits on a single delimiter character. Empty fields are kept.
std::vector<std::string> split(const std::string& s, char delim);

// Parses CSV text into rows of cells.
//
// Supports double-quoted cells (with "" as an escaped quote), LF and CRLF
// line endings, and a leading UTF-8 BOM. Blank lines are skipped.
// Throws std::runtime_error on an unterminated quoted cell.
std::vector<std::vector<std::string>> parse_csv(const std::string& text);

// Escapes a string for safe inclusion in a CSV cell.
//
// If the string contains a comma, quote, or newline, the result will be wrapped
// in double-quotes and any internal quotes will be doubled.
std::string csv_escape(const std::string& s);

// Pads with spaces to `width` characters. Strings already at least that wide are returned as-is.
std::string pad_left(const std::string& s, std::size_t width);
std::string pad_right(const std::string& s, std::size_t width);

bool is_digits(const std::string& s);

} // namespace parcelday
