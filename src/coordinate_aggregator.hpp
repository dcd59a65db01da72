#pragma once

#include <Eigen/Dense>

#include <string>
#include <vector>

#include "coordinate_table.hpp"

namespace scanplot {

// Coordinate table plus row-wise statistics over all X and all Y columns.
struct SummaryTable {
  CoordinateTable coordinates;
  Eigen::VectorXd mean_x;
  Eigen::VectorXd median_x;
  Eigen::VectorXd mean_y;
  Eigen::VectorXd median_y;

  std::size_t rows() const { return coordinates.rows(); }

  // x_0, y_0, x_1, y_1, ..., mean_x, median_x, mean_y, median_y
  std::vector<std::string> columnNames() const;
};

// Mean and median of the non-NaN values; NaN if there are none.
double meanIgnoringMissing(const std::vector<double>& v);
double medianIgnoringMissing(std::vector<double> v);

// Row-wise mean/median per axis. Columns are picked by their axis tag.
// Padded cells and NaN values are ignored; a row with nothing to aggregate
// gets NaN. The input table is copied, not modified.
SummaryTable summarise(const CoordinateTable& table);

}  // namespace scanplot
