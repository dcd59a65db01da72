#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <string>
#include <vector>

namespace scanplot {

enum class Axis {
  X,
  Y
};

std::string axisToString(Axis a);  // "x" / "y"

// Structural identity of a coordinate column: the block it came from and
// its axis. The display name ("x_3") is derived, never parsed back.
struct ColumnId {
  std::size_t block = 0;
  Axis axis = Axis::X;

  std::string name() const;
};

bool operator==(const ColumnId& a, const ColumnId& b);

// Column-per-block coordinate table. Cells are stored densely; a cell
// beyond a column's own length holds NaN and isMissing() reports it.
class CoordinateTable {
 public:
  CoordinateTable() = default;

  // Preallocate storage for at least rows x cols cells. Does not change
  // rows() or cols().
  void reserve(std::size_t rows, std::size_t cols);

  // Append a column. Rows grow to the longest column; shorter columns are
  // padded with NaN. Storage grows geometrically.
  void addColumn(const ColumnId& id, const std::vector<double>& values);

  std::size_t rows() const { return rows_; }
  std::size_t cols() const { return ids_.size(); }

  const std::vector<ColumnId>& columns() const { return ids_; }
  const ColumnId& column(std::size_t c) const { return ids_.at(c); }

  // Number of real (non-padded) cells in column c.
  std::size_t columnLength(std::size_t c) const { return lengths_.at(c); }

  double at(std::size_t row, std::size_t col) const;
  bool isMissing(std::size_t row, std::size_t col) const;

  // Present cells of column c, without padding.
  std::vector<double> columnValues(std::size_t c) const;

  // Indices of the columns tagged with the given axis, in table order.
  std::vector<std::size_t> axisColumns(Axis a) const;

  // True if any column is shorter than rows().
  bool isRagged() const;

  // rows() x cols() view of the cells.
  Eigen::Ref<const Eigen::MatrixXd> values() const;

 private:
  std::vector<ColumnId> ids_;
  std::vector<std::size_t> lengths_;
  std::size_t rows_ = 0;
  Eigen::MatrixXd values_;  // capacity; cells outside rows() x cols() are NaN
};

}  // namespace scanplot
