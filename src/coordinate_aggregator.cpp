#include "coordinate_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace scanplot {

static constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

std::vector<std::string> SummaryTable::columnNames() const {
  std::vector<std::string> names;
  names.reserve(coordinates.cols() + 4);
  for (const auto& id : coordinates.columns()) {
    names.push_back(id.name());
  }
  names.push_back("mean_x");
  names.push_back("median_x");
  names.push_back("mean_y");
  names.push_back("median_y");
  return names;
}

double meanIgnoringMissing(const std::vector<double>& v) {
  double sum = 0.0;
  std::size_t n = 0;
  for (double x : v) {
    if (std::isnan(x)) continue;
    sum += x;
    ++n;
  }
  return (n == 0) ? kMissing : sum / static_cast<double>(n);
}

double medianIgnoringMissing(std::vector<double> v) {
  v.erase(std::remove_if(v.begin(), v.end(), [](double x) { return std::isnan(x); }), v.end());
  if (v.empty()) return kMissing;

  const std::size_t mid = v.size() / 2;
  std::nth_element(v.begin(), v.begin() + mid, v.end());
  const double upper = v[mid];
  if (v.size() % 2 == 1) {
    return upper;
  }
  const double lower = *std::max_element(v.begin(), v.begin() + mid);
  return 0.5 * (lower + upper);
}

static void aggregateAxis(const CoordinateTable& table,
                          Axis axis,
                          Eigen::VectorXd& mean,
                          Eigen::VectorXd& median) {
  const std::size_t n_rows = table.rows();
  const std::vector<std::size_t> cols = table.axisColumns(axis);

  mean = Eigen::VectorXd::Constant(static_cast<Eigen::Index>(n_rows), kMissing);
  median = Eigen::VectorXd::Constant(static_cast<Eigen::Index>(n_rows), kMissing);

  std::vector<double> cells;
  cells.reserve(cols.size());
  for (std::size_t r = 0; r < n_rows; ++r) {
    cells.clear();
    for (std::size_t c : cols) {
      if (!table.isMissing(r, c)) {
        cells.push_back(table.at(r, c));
      }
    }
    const Eigen::Index i = static_cast<Eigen::Index>(r);
    mean(i) = meanIgnoringMissing(cells);
    median(i) = medianIgnoringMissing(cells);
  }
}

SummaryTable summarise(const CoordinateTable& table) {
  SummaryTable out;
  out.coordinates = table;
  aggregateAxis(table, Axis::X, out.mean_x, out.median_x);
  aggregateAxis(table, Axis::Y, out.mean_y, out.median_y);
  return out;
}

}  // namespace scanplot
