#include "scan_batch.hpp"

#include <filesystem>

#include "scan_errors.hpp"
#include "scan_title.hpp"
#include "scoped_temp_file.hpp"

namespace scanplot {

FileReport processUpload(const UploadedFile& file, const PipelineOptions& opts) {
  FileReport report;
  report.name = file.name;
  report.title = displayTitle(file.name);

  try {
    const ScopedTempFile staged(file.bytes, std::filesystem::path(file.name).filename().string());
    const std::vector<ScanBlock> blocks = loadScanFile(staged.path(), opts.parser);

    MetadataTable metadata = buildMetadataTable(blocks);
    SummaryTable summary = summarise(buildCoordinateTable(blocks, opts.ragged));

    report.block_count = blocks.size();
    report.metadata = std::move(metadata);
    report.summary = std::move(summary);
    report.ok = true;
  } catch (const ScanError& e) {
    report.ok = false;
    report.error = e.what();
  }

  return report;
}

std::vector<FileReport> processBatch(const std::vector<UploadedFile>& files, const PipelineOptions& opts) {
  std::vector<FileReport> reports;
  reports.reserve(files.size());
  for (const auto& f : files) {
    reports.push_back(processUpload(f, opts));
  }
  return reports;
}

}  // namespace scanplot
