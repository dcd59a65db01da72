#pragma once

#include <string>
#include <vector>

#include "coordinate_aggregator.hpp"
#include "scan_block.hpp"
#include "scan_parser.hpp"

namespace scanplot {

// An input file as received: its original name and raw bytes.
struct UploadedFile {
  std::string name;
  std::string bytes;
};

struct PipelineOptions {
  ParserOptions parser;
  RaggedPolicy ragged = RaggedPolicy::Pad;
};

// Outcome for one file. Tables are filled only when ok is true.
struct FileReport {
  std::string name;
  std::string title;
  bool ok = false;
  std::string error;
  std::size_t block_count = 0;
  MetadataTable metadata;
  SummaryTable summary;
};

// Parse and aggregate one upload. The bytes are staged in a temporary file
// that is removed before returning, whatever the outcome. ScanError is
// reported in the result, not thrown.
FileReport processUpload(const UploadedFile& file, const PipelineOptions& opts = PipelineOptions());

// processUpload() on each file in order; a failing file does not stop the
// others.
std::vector<FileReport> processBatch(const std::vector<UploadedFile>& files,
                                     const PipelineOptions& opts = PipelineOptions());

}  // namespace scanplot
