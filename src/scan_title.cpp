#include "scan_title.hpp"

#include <filesystem>
#include <vector>

namespace scanplot {

static std::vector<std::string> splitUnderscore(const std::string& s) {
  std::vector<std::string> out;
  std::string::size_type start = 0;
  while (true) {
    const std::string::size_type pos = s.find('_', start);
    out.push_back(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
    if (pos == std::string::npos) break;
    start = pos + 1;
  }
  return out;
}

std::string displayTitle(const std::string& filename) {
  const std::string stem = std::filesystem::path(filename).stem().string();
  const std::vector<std::string> t = splitUnderscore(stem);
  if (t.size() < 8 || t[7].empty()) {
    return stem;
  }

  std::string minute = t[5];
  if (minute.size() < 2) minute.insert(0, 2 - minute.size(), '0');

  return "Pico " + std::string(1, t[7].back()) + " - " + t[1] + "/" + t[2] + "/" + t[3] + " " +
         t[4] + ":" + minute;
}

}  // namespace scanplot
