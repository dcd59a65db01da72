#include "coordinate_table.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace scanplot {

static constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

std::string axisToString(Axis a) {
  switch (a) {
    case Axis::X: return "x";
    case Axis::Y: return "y";
    default: return "x";
  }
}

std::string ColumnId::name() const {
  return axisToString(axis) + "_" + std::to_string(block);
}

bool operator==(const ColumnId& a, const ColumnId& b) {
  return a.block == b.block && a.axis == b.axis;
}

void CoordinateTable::reserve(std::size_t rows, std::size_t cols) {
  const Eigen::Index old_rows = values_.rows();
  const Eigen::Index old_cols = values_.cols();
  const Eigen::Index new_rows = std::max<Eigen::Index>(old_rows, static_cast<Eigen::Index>(rows));
  const Eigen::Index new_cols = std::max<Eigen::Index>(old_cols, static_cast<Eigen::Index>(cols));
  if (new_rows == old_rows && new_cols == old_cols) {
    return;
  }

  Eigen::MatrixXd grown = Eigen::MatrixXd::Constant(new_rows, new_cols, kMissing);
  if (old_rows > 0 && old_cols > 0) {
    grown.topLeftCorner(old_rows, old_cols) = values_;
  }
  values_.swap(grown);
}

void CoordinateTable::addColumn(const ColumnId& id, const std::vector<double>& values) {
  const std::size_t col = ids_.size();
  const std::size_t need_rows = std::max(rows_, values.size());
  const std::size_t cap_rows = static_cast<std::size_t>(values_.rows());
  const std::size_t cap_cols = static_cast<std::size_t>(values_.cols());
  if (need_rows > cap_rows || col + 1 > cap_cols) {
    reserve(need_rows > cap_rows ? std::max(need_rows, 2 * cap_rows) : cap_rows,
            col + 1 > cap_cols ? std::max<std::size_t>(col + 1, 2 * cap_cols) : cap_cols);
  }

  for (std::size_t r = 0; r < values.size(); ++r) {
    values_(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(col)) = values[r];
  }

  rows_ = need_rows;
  ids_.push_back(id);
  lengths_.push_back(values.size());
}

double CoordinateTable::at(std::size_t row, std::size_t col) const {
  if (row >= rows() || col >= cols()) {
    throw std::out_of_range("CoordinateTable::at: cell (" + std::to_string(row) + ", " +
                            std::to_string(col) + ") outside table");
  }
  return values_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col));
}

bool CoordinateTable::isMissing(std::size_t row, std::size_t col) const {
  return row >= columnLength(col);
}

std::vector<double> CoordinateTable::columnValues(std::size_t c) const {
  const std::size_t n = columnLength(c);
  std::vector<double> v(n);
  for (std::size_t r = 0; r < n; ++r) {
    v[r] = values_(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c));
  }
  return v;
}

std::vector<std::size_t> CoordinateTable::axisColumns(Axis a) const {
  std::vector<std::size_t> out;
  for (std::size_t c = 0; c < ids_.size(); ++c) {
    if (ids_[c].axis == a) out.push_back(c);
  }
  return out;
}

Eigen::Ref<const Eigen::MatrixXd> CoordinateTable::values() const {
  return values_.topLeftCorner(static_cast<Eigen::Index>(rows_), static_cast<Eigen::Index>(ids_.size()));
}

bool CoordinateTable::isRagged() const {
  for (std::size_t len : lengths_) {
    if (len != rows()) return true;
  }
  return false;
}

}  // namespace scanplot
