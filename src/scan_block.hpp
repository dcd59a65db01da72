#pragma once

#include <array>
#include <string>
#include <vector>

namespace scanplot {

// One measurement event: metadata line + marker + X row + Y row.
struct ScanBlock {
  std::string timestamp;              // "YYYY-MM-DDTHH:MM:SS..." as found in the file
  double height = 0.0;
  double gap = 0.0;
  double angle = 0.0;
  double fixed_point_height = 0.0;
  std::vector<double> x_values;
  std::vector<double> y_values;
};

struct MetadataRow {
  std::string date_time;
  double height = 0.0;
  double gap = 0.0;
  double angle = 0.0;
  double fixed_point_height = 0.0;
};

// One row per ScanBlock, in file order.
struct MetadataTable {
  static constexpr std::array<const char*, 5> kColumnNames = {
      "DateTime", "Height", "Gab", "Angle", "FixedPointHeight"};

  std::vector<MetadataRow> rows;
};

}  // namespace scanplot
