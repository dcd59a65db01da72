#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>

#include "coordinate_aggregator.hpp"
#include "scan_block.hpp"

namespace scanplot {

// CSV writers (RFC 4180 quoting). Missing cells are written as empty fields.
// Return false if the file could not be opened or written.
bool writeMetadataCsv(const std::filesystem::path& file, const MetadataTable& table);
bool writeSummaryCsv(const std::filesystem::path& file, const SummaryTable& summary);

void writeMetadataCsv(std::ostream& os, const MetadataTable& table);
void writeSummaryCsv(std::ostream& os, const SummaryTable& summary);

// Console previews. max_rows == 0 prints every row.
void printMetadata(std::ostream& os, const MetadataTable& table);
void printSummaryHead(std::ostream& os, const SummaryTable& summary, std::size_t max_rows = 5);

}  // namespace scanplot
