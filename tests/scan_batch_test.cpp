#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "scan_batch.hpp"

namespace fs = std::filesystem;
using namespace scanplot;

namespace {

const char* kGood =
    "DateTime;Height;Gab;Angle;FixedPointHeight\n"
    "2025-05-26T14:58:59;10.0;2.0;0.0;1.5\n"
    "SCAN\n"
    "X;;1.0;3.0\n"
    "Y;;2.0;4.0\n"
    "2025-05-26T14:59:10;10.0;2.0;0.0;1.5\n"
    "SCAN\n"
    "X;;5.0;7.0\n"
    "Y;;6.0;8.0\n";

// Staged uploads keep the upload name as a suffix.
std::size_t countStagedFiles(const std::string& marker) {
  std::size_t n = 0;
  for (const auto& e : fs::directory_iterator(fs::temp_directory_path())) {
    if (e.path().filename().string().find(marker) != std::string::npos) ++n;
  }
  return n;
}

}  // namespace

TEST(ScanBatch, ProcessesGoodFile) {
  const FileReport r = processUpload(UploadedFile{"Scan_2025_05_26_14_58_x_Pico1.txt", kGood});
  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.title, "Pico 1 - 2025/05/26 14:58");
  EXPECT_EQ(r.block_count, 2u);
  EXPECT_EQ(r.metadata.rows.size(), 2u);
  EXPECT_EQ(r.summary.coordinates.cols(), 4u);
  EXPECT_DOUBLE_EQ(r.summary.mean_x(0), 3.0);
  EXPECT_DOUBLE_EQ(r.summary.median_y(1), 6.0);
}

TEST(ScanBatch, FailingFileDoesNotStopOthers) {
  const std::vector<UploadedFile> files = {
      {"bad.txt", "2025-05-26T14:58:59;10.0;2.0;0.0;1.5\nSCAN\nX;;1.0;x\nY;;1.0;2.0\n"},
      {"truncated.txt", "2025-05-26T14:58:59;10.0;2.0;0.0;1.5\n"},
      {"good.txt", kGood},
  };
  const std::vector<FileReport> reports = processBatch(files);
  ASSERT_EQ(reports.size(), 3u);

  EXPECT_FALSE(reports[0].ok);
  EXPECT_NE(reports[0].error.find("line 3"), std::string::npos);
  EXPECT_TRUE(reports[0].metadata.rows.empty());

  EXPECT_FALSE(reports[1].ok);
  EXPECT_FALSE(reports[1].error.empty());
  EXPECT_EQ(reports[1].block_count, 0u);

  EXPECT_TRUE(reports[2].ok);
  EXPECT_EQ(reports[2].block_count, 2u);
}

TEST(ScanBatch, RaggedRejectIsReportedPerFile) {
  const std::string ragged =
      "2025-05-26T14:58:59;10.0;2.0;0.0;1.5\nSCAN\nX;;1.0;2.0\nY;;1.0;2.0\n"
      "2025-05-26T14:59:00;10.0;2.0;0.0;1.5\nSCAN\nX;;1.0\nY;;1.0\n";
  PipelineOptions opts;
  opts.ragged = RaggedPolicy::Reject;
  const FileReport rejected = processUpload(UploadedFile{"ragged.txt", ragged}, opts);
  EXPECT_FALSE(rejected.ok);

  const FileReport padded = processUpload(UploadedFile{"ragged.txt", ragged});
  ASSERT_TRUE(padded.ok);
  EXPECT_TRUE(padded.summary.coordinates.isRagged());
  EXPECT_DOUBLE_EQ(padded.summary.mean_x(1), 2.0);
}

TEST(ScanBatch, TempFilesAreReleasedOnEveryPath) {
  const std::string marker = "release_check_b81d";
  EXPECT_TRUE(processUpload(UploadedFile{marker + "_good.txt", kGood}).ok);
  EXPECT_FALSE(processUpload(UploadedFile{marker + "_truncated.txt",
                                          "2025-05-26T14:58:59;10.0;2.0;0.0;1.5\nSCAN\n"}).ok);
  EXPECT_FALSE(processUpload(UploadedFile{marker + "_bad.txt",
                                          "2025-05-26T14:58:59;h;2.0;0.0;1.5\nSCAN\nX;;1\nY;;1\n"}).ok);
  EXPECT_EQ(countStagedFiles(marker), 0u);
}
