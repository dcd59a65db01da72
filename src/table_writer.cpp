#include "table_writer.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace scanplot {

static std::string formatCell(double v) {
  if (std::isnan(v)) return std::string();
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
  return oss.str();
}

// RFC 4180: quote a field holding a delimiter, quote or line break, and
// double any embedded quote.
static std::string csvField(const std::string& text) {
  if (text.find_first_of(",\"\r\n") == std::string::npos) {
    return text;
  }
  std::string out = "\"";
  for (char c : text) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

// One row of the summary: coordinate cells followed by the four statistics.
static std::vector<double> summaryRow(const SummaryTable& s, std::size_t r) {
  std::vector<double> row;
  row.reserve(s.coordinates.cols() + 4);
  const double nan = std::numeric_limits<double>::quiet_NaN();
  for (std::size_t c = 0; c < s.coordinates.cols(); ++c) {
    row.push_back(s.coordinates.isMissing(r, c) ? nan : s.coordinates.at(r, c));
  }
  const Eigen::Index i = static_cast<Eigen::Index>(r);
  row.push_back(s.mean_x(i));
  row.push_back(s.median_x(i));
  row.push_back(s.mean_y(i));
  row.push_back(s.median_y(i));
  return row;
}

void writeMetadataCsv(std::ostream& os, const MetadataTable& table) {
  for (std::size_t i = 0; i < MetadataTable::kColumnNames.size(); ++i) {
    os << MetadataTable::kColumnNames[i] << (i + 1 < MetadataTable::kColumnNames.size() ? "," : "\n");
  }
  for (const auto& r : table.rows) {
    os << csvField(r.date_time) << "," << formatCell(r.height) << "," << formatCell(r.gap) << ","
       << formatCell(r.angle) << "," << formatCell(r.fixed_point_height) << "\n";
  }
}

void writeSummaryCsv(std::ostream& os, const SummaryTable& summary) {
  const std::vector<std::string> names = summary.columnNames();
  for (std::size_t i = 0; i < names.size(); ++i) {
    os << names[i] << (i + 1 < names.size() ? "," : "\n");
  }
  for (std::size_t r = 0; r < summary.rows(); ++r) {
    const std::vector<double> row = summaryRow(summary, r);
    for (std::size_t i = 0; i < row.size(); ++i) {
      os << formatCell(row[i]) << (i + 1 < row.size() ? "," : "\n");
    }
  }
}

bool writeMetadataCsv(const std::filesystem::path& file, const MetadataTable& table) {
  std::ofstream csv(file);
  if (!csv.is_open()) {
    return false;
  }
  writeMetadataCsv(csv, table);
  csv.close();
  return static_cast<bool>(csv);
}

bool writeSummaryCsv(const std::filesystem::path& file, const SummaryTable& summary) {
  std::ofstream csv(file);
  if (!csv.is_open()) {
    return false;
  }
  writeSummaryCsv(csv, summary);
  csv.close();
  return static_cast<bool>(csv);
}

void printMetadata(std::ostream& os, const MetadataTable& table) {
  os << std::left << std::setw(22) << MetadataTable::kColumnNames[0];
  for (std::size_t i = 1; i < MetadataTable::kColumnNames.size(); ++i) {
    os << std::right << std::setw(18) << MetadataTable::kColumnNames[i];
  }
  os << "\n";
  for (const auto& r : table.rows) {
    os << std::left << std::setw(22) << r.date_time << std::right
       << std::setw(18) << r.height
       << std::setw(18) << r.gap
       << std::setw(18) << r.angle
       << std::setw(18) << r.fixed_point_height << "\n";
  }
}

void printSummaryHead(std::ostream& os, const SummaryTable& summary, std::size_t max_rows) {
  const std::size_t n = (max_rows == 0) ? summary.rows() : std::min(max_rows, summary.rows());
  const std::vector<std::string> names = summary.columnNames();

  os << std::right << std::setw(6) << "";
  for (const auto& name : names) os << std::setw(12) << name;
  os << "\n";

  for (std::size_t r = 0; r < n; ++r) {
    os << std::setw(6) << r;
    for (double v : summaryRow(summary, r)) {
      if (std::isnan(v)) {
        os << std::setw(12) << "NaN";
      } else {
        os << std::setw(12) << v;
      }
    }
    os << "\n";
  }
  if (n < summary.rows()) {
    os << "... (" << summary.rows() - n << " more rows)\n";
  }
}

}  // namespace scanplot
