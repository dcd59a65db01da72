#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <regex>

namespace scanplot {

std::string trim(const std::string& s) {
  auto is_ws = [](unsigned char c) { return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return std::string();
  return std::string(b, e);
}

std::vector<std::string> splitFields(const std::string& line, char delim) {
  std::vector<std::string> fields;
  std::string::size_type start = 0;
  while (true) {
    const std::string::size_type pos = line.find(delim, start);
    if (pos == std::string::npos) {
      fields.push_back(trim(line.substr(start)));
      break;
    }
    fields.push_back(trim(line.substr(start, pos - start)));
    start = pos + 1;
  }
  return fields;
}

bool parseDouble(const std::string& field, double& out) {
  const std::string s = trim(field);
  if (s.empty()) return false;

  std::string body;
  body.reserve(s.size());
  for (char c : s) body.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (body[0] == '+' || body[0] == '-') body.erase(0, 1);

  const bool special = (body == "nan" || body == "inf" || body == "infinity");
  if (!special && body.find_first_not_of("0123456789.e+-") != std::string::npos) {
    return false;
  }

  const char* begin = s.c_str();
  char* end = nullptr;
  const double v = std::strtod(begin, &end);
  if (end == begin || *end != '\0') {
    return false;
  }
  out = v;
  return true;
}

bool parseCount(const std::string& text, std::size_t& out) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
  if (errno == ERANGE || *end != '\0' || v > std::numeric_limits<std::size_t>::max()) {
    return false;
  }
  out = static_cast<std::size_t>(v);
  return true;
}

bool readLine(std::istream& in, std::string& line) {
  using traits = std::istream::traits_type;
  line.clear();
  bool got_any = false;
  for (traits::int_type c = in.get(); !traits::eq_int_type(c, traits::eof()); c = in.get()) {
    got_any = true;
    if (c == '\n') {
      return true;
    }
    if (c == '\r') {
      if (traits::eq_int_type(in.peek(), '\n')) in.get();
      return true;
    }
    line.push_back(traits::to_char_type(c));
  }
  return got_any;
}

bool looksLikeTimestamp(const std::string& text) {
  static const std::regex re(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2})");
  return std::regex_search(text, re);
}

void stripByteOrderMark(std::string& line) {
  static const std::string kBom = "\xEF\xBB\xBF";
  if (line.compare(0, kBom.size(), kBom) == 0) {
    line.erase(0, kBom.size());
  }
}

}  // namespace scanplot
