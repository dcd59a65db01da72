#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace scanplot {

// Strip leading/trailing whitespace (including a CR left by CRLF files).
std::string trim(const std::string& s);

// Split on a single-character delimiter and trim every field.
// An empty input yields one empty field.
std::vector<std::string> splitFields(const std::string& line, char delim = ';');

// Parse a whole field as a decimal double (program runs in the "C" locale).
// Accepts an optional sign, digits, '.', and an exponent, or one of
// "nan", "inf", "infinity" in any case. Hex forms and "nan(...)" are
// rejected. Returns true on success.
bool parseDouble(const std::string& field, double& out);

// Parse a non-negative decimal count such as a CLI row limit.
// A sign, blanks or trailing text make it fail.
bool parseCount(const std::string& text, std::size_t& out);

// Read one line, ending at "\n", "\r\n" or a lone "\r". The terminator is
// not stored. Returns false only when nothing was left to read.
bool readLine(std::istream& in, std::string& line);

// True if the text starts with an ISO-8601 style date-time,
// e.g. "2025-05-26T14:58:59". Trailing content is tolerated.
bool looksLikeTimestamp(const std::string& text);

// Remove a leading UTF-8 byte order mark, if present.
void stripByteOrderMark(std::string& line);

}  // namespace scanplot
