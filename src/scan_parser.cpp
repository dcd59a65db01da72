#include "scan_parser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <utility>

#include "scan_errors.hpp"
#include "text_utils.hpp"

namespace scanplot {

RaggedPolicy raggedPolicyFromString(const std::string& s) {
  std::string t;
  t.reserve(s.size());
  for (char c : s) {
    t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (t == "pad") return RaggedPolicy::Pad;
  if (t == "reject") return RaggedPolicy::Reject;
  throw std::invalid_argument("unknown ragged policy: " + s);
}

std::string raggedPolicyToString(RaggedPolicy p) {
  switch (p) {
    case RaggedPolicy::Pad: return "pad";
    case RaggedPolicy::Reject: return "reject";
    default: return "pad";
  }
}

// Next physical line, counting lines from 1. The BOM is dropped from line 1.
static bool nextLine(std::istream& in, std::string& line, std::size_t& line_no) {
  if (!readLine(in, line)) {
    return false;
  }
  if (++line_no == 1) {
    stripByteOrderMark(line);
  }
  return true;
}

static double parseScalar(const std::string& field, const char* name, std::size_t line_no) {
  double v = 0.0;
  if (!parseDouble(field, v)) {
    throw FormatError(std::string(name) + " is not a number: '" + field + "'", line_no);
  }
  return v;
}

// "X;;1.0;2.0" -> {1.0, 2.0}. The row tag and the empty column are dropped.
static std::vector<double> parseCoordinateRow(const std::string& line,
                                              char delim,
                                              const char* row_name,
                                              std::size_t line_no) {
  const std::vector<std::string> fields = splitFields(trim(line), delim);
  std::vector<double> values;
  if (fields.size() <= 2) {
    return values;
  }
  values.reserve(fields.size() - 2);
  for (std::size_t i = 2; i < fields.size(); ++i) {
    double v = 0.0;
    if (!parseDouble(fields[i], v)) {
      throw FormatError(std::string(row_name) + " row cell " + std::to_string(i - 2) +
                            " is not a number: '" + fields[i] + "'",
                        line_no);
    }
    values.push_back(v);
  }
  return values;
}

std::vector<ScanBlock> parseScanBlocks(std::istream& in, const ParserOptions& opts) {
  std::vector<ScanBlock> blocks;
  std::size_t line_no = 0;
  std::string raw;

  while (nextLine(in, raw, line_no)) {
    const std::string line = trim(raw);
    if (line.empty()) {
      continue;
    }

    // Anything that is not a metadata row (header, comment, stray text) is skipped.
    const std::vector<std::string> parts = splitFields(line, opts.delimiter);
    if (parts.size() != 5 || !looksLikeTimestamp(parts[0])) {
      continue;
    }

    const std::size_t start_line = line_no;
    ScanBlock block;
    block.timestamp = parts[0];
    block.height = parseScalar(parts[1], "Height", start_line);
    block.gap = parseScalar(parts[2], "Gab", start_line);
    block.angle = parseScalar(parts[3], "Angle", start_line);
    block.fixed_point_height = parseScalar(parts[4], "FixedPointHeight", start_line);

    std::string marker;
    if (!nextLine(in, marker, line_no)) {
      throw TruncatedBlockError("input ends before the marker line of the block starting here",
                                start_line);
    }
    if (opts.strict_marker && trim(marker) != opts.marker) {
      throw FormatError("expected marker '" + opts.marker + "', got '" + trim(marker) + "'",
                        line_no);
    }

    std::string x_row;
    if (!nextLine(in, x_row, line_no)) {
      throw TruncatedBlockError("input ends before the X row of the block starting here", start_line);
    }
    block.x_values = parseCoordinateRow(x_row, opts.delimiter, "X", line_no);

    std::string y_row;
    if (!nextLine(in, y_row, line_no)) {
      throw TruncatedBlockError("input ends before the Y row of the block starting here", start_line);
    }
    block.y_values = parseCoordinateRow(y_row, opts.delimiter, "Y", line_no);

    blocks.push_back(std::move(block));
  }

  if (in.bad()) {
    throw IoError("read error after line " + std::to_string(line_no));
  }

  return blocks;
}

std::vector<ScanBlock> loadScanFile(const std::filesystem::path& file, const ParserOptions& opts) {
  std::ifstream ifs(file);
  if (!ifs.is_open()) {
    throw IoError("cannot open " + file.string());
  }
  return parseScanBlocks(ifs, opts);
}

MetadataTable buildMetadataTable(const std::vector<ScanBlock>& blocks) {
  MetadataTable table;
  table.rows.reserve(blocks.size());
  for (const auto& b : blocks) {
    MetadataRow row;
    row.date_time = b.timestamp;
    row.height = b.height;
    row.gap = b.gap;
    row.angle = b.angle;
    row.fixed_point_height = b.fixed_point_height;
    table.rows.push_back(row);
  }
  return table;
}

CoordinateTable buildCoordinateTable(const std::vector<ScanBlock>& blocks, RaggedPolicy policy) {
  if (policy == RaggedPolicy::Reject && !blocks.empty()) {
    const std::size_t expected = blocks.front().x_values.size();
    for (std::size_t i = 0; i < blocks.size(); ++i) {
      const std::size_t nx = blocks[i].x_values.size();
      const std::size_t ny = blocks[i].y_values.size();
      if (nx != expected || ny != expected) {
        throw RaggedTableError("block " + std::to_string(i) + " has " + std::to_string(nx) +
                               " X and " + std::to_string(ny) + " Y values, expected " +
                               std::to_string(expected));
      }
    }
  }

  std::size_t longest = 0;
  for (const auto& b : blocks) {
    longest = std::max({longest, b.x_values.size(), b.y_values.size()});
  }

  CoordinateTable table;
  table.reserve(longest, 2 * blocks.size());
  for (std::size_t i = 0; i < blocks.size(); ++i) {
    table.addColumn(ColumnId{i, Axis::X}, blocks[i].x_values);
    table.addColumn(ColumnId{i, Axis::Y}, blocks[i].y_values);
  }
  return table;
}

}  // namespace scanplot
