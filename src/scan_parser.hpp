#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "coordinate_table.hpp"
#include "scan_block.hpp"

namespace scanplot {

enum class RaggedPolicy {
  Pad,     // keep the file, absent cells become NaN
  Reject   // throw RaggedTableError
};

RaggedPolicy raggedPolicyFromString(const std::string& s);
std::string raggedPolicyToString(RaggedPolicy p);

struct ParserOptions {
  char delimiter = ';';
  bool strict_marker = false;         // validate the line after the block start
  std::string marker = "SCAN";
};

// Read scan blocks from a line-oriented text stream.
//
// A block starts at a line with exactly 5 delimited fields whose first field
// begins with "YYYY-MM-DDTHH:MM:SS". The next three physical lines are the
// marker, the X row and the Y row; row values start at the third field.
// Blank lines and any other line outside a block are skipped.
//
// Throws FormatError on an unparsable number (or wrong marker in strict
// mode) and TruncatedBlockError if the input ends inside a block. Nothing
// is returned on error.
std::vector<ScanBlock> parseScanBlocks(std::istream& in, const ParserOptions& opts = ParserOptions());

// Same as parseScanBlocks() on a file. Throws IoError if it cannot be opened.
std::vector<ScanBlock> loadScanFile(const std::filesystem::path& file,
                                    const ParserOptions& opts = ParserOptions());

MetadataTable buildMetadataTable(const std::vector<ScanBlock>& blocks);

// One x_i / y_i column pair per block, in block order.
// Under RaggedPolicy::Reject, throws RaggedTableError if the columns do not
// all have the same length.
CoordinateTable buildCoordinateTable(const std::vector<ScanBlock>& blocks,
                                     RaggedPolicy policy = RaggedPolicy::Pad);

}  // namespace scanplot
