#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "scan_batch.hpp"
#include "scan_parser.hpp"
#include "table_writer.hpp"
#include "text_utils.hpp"

#ifndef SCANPLOT_DATA_DIR
#define SCANPLOT_DATA_DIR ""
#endif

namespace fs = std::filesystem;
using scanplot::FileReport;
using scanplot::PipelineOptions;
using scanplot::UploadedFile;

struct Args {
  fs::path data_dir;
  fs::path out_dir = ".";
  std::vector<std::string> files;

  PipelineOptions pipeline;

  std::size_t head_rows = 5;
  bool write_csv = true;
};

static void printUsage(const char* exe) {
  std::cout
      << "Usage: " << exe << " [options] <file>...\n\n"
      << "Parses instrument scan files and writes per-scan metadata and\n"
      << "per-point mean/median coordinate tables.\n\n"
      << "Options:\n"
      << "  --data_dir <path>        Directory for relative input paths (default: current directory)\n"
      << "  --out_dir <path>         Directory for CSV output (default: .)\n"
      << "  --ragged <policy>        Unequal coordinate rows: pad|reject (default: pad)\n"
      << "  --strict_marker          Require the marker line after each metadata row\n"
      << "  --marker <text>          Expected marker line (default: SCAN)\n"
      << "  --head <N>               Summary rows printed per file, 0 = all (default: 5)\n"
      << "  --no_csv                 Do not write CSV output\n"
      << "  -h, --help               Show this help\n";
}

static bool parseArgs(int argc, char** argv, Args& a) {
  // Default data dir from compile definition (if provided)
  if (std::string(SCANPLOT_DATA_DIR).size() > 0) {
    a.data_dir = fs::path(SCANPLOT_DATA_DIR);
  } else {
    a.data_dir = fs::current_path();
  }

  for (int i = 1; i < argc; ++i) {
    const std::string key = argv[i];
    auto needValue = [&](const std::string& k) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << k << "\n";
        return nullptr;
      }
      return argv[++i];
    };

    try {
      if (key == "-h" || key == "--help") {
        return false;
      } else if (key == "--data_dir") {
        const char* v = needValue(key);
        if (!v) return false;
        a.data_dir = fs::path(v);
      } else if (key == "--out_dir") {
        const char* v = needValue(key);
        if (!v) return false;
        a.out_dir = fs::path(v);
      } else if (key == "--ragged") {
        const char* v = needValue(key);
        if (!v) return false;
        a.pipeline.ragged = scanplot::raggedPolicyFromString(v);
      } else if (key == "--strict_marker") {
        a.pipeline.parser.strict_marker = true;
      } else if (key == "--marker") {
        const char* v = needValue(key);
        if (!v) return false;
        a.pipeline.parser.marker = v;
      } else if (key == "--head") {
        const char* v = needValue(key);
        if (!v) return false;
        if (!scanplot::parseCount(v, a.head_rows)) {
          std::cerr << "Invalid value for " << key << ": '" << v << "' (expected a count >= 0)\n";
          return false;
        }
      } else if (key == "--no_csv") {
        a.write_csv = false;
      } else if (!key.empty() && key[0] == '-') {
        std::cerr << "Unknown option: " << key << "\n";
        return false;
      } else {
        a.files.push_back(key);
      }
    } catch (const std::invalid_argument& e) {
      std::cerr << "Invalid value for " << key << ": " << e.what() << "\n";
      return false;
    }
  }

  return true;
}

// Read a file into memory the way an upload arrives: name plus raw bytes.
static bool readUpload(const fs::path& path, UploadedFile& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    return false;
  }
  out.name = path.filename().string();
  out.bytes.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
  return !ifs.bad();
}

static void writeCsvOutputs(const Args& args, const FileReport& report) {
  const std::string stem = fs::path(report.name).stem().string();
  const fs::path meta_path = args.out_dir / (stem + "_metadata.csv");
  const fs::path summary_path = args.out_dir / (stem + "_summary.csv");

  if (scanplot::writeMetadataCsv(meta_path, report.metadata)) {
    std::cout << "Wrote CSV: " << meta_path.string() << "\n";
  } else {
    std::cerr << "Warning: could not open CSV file for writing: " << meta_path.string() << "\n";
  }
  if (scanplot::writeSummaryCsv(summary_path, report.summary)) {
    std::cout << "Wrote CSV: " << summary_path.string() << "\n";
  } else {
    std::cerr << "Warning: could not open CSV file for writing: " << summary_path.string() << "\n";
  }
}

int main(int argc, char** argv) {
  Args args;
  if (!parseArgs(argc, argv, args)) {
    printUsage(argv[0]);
    return (argc > 1) ? 1 : 0;
  }

  if (args.files.empty()) {
    std::cerr << "No input files.\n";
    printUsage(argv[0]);
    return 2;
  }

  if (args.write_csv) {
    std::error_code ec;
    fs::create_directories(args.out_dir, ec);
    if (ec) {
      std::cerr << "Warning: could not create output directory " << args.out_dir.string() << ": "
                << ec.message() << "\n";
    }
  }

  std::size_t failed = 0;
  std::vector<UploadedFile> uploads;
  for (const auto& f : args.files) {
    fs::path path(f);
    if (path.is_relative()) {
      path = args.data_dir / path;
    }

    UploadedFile upload;
    if (!readUpload(path, upload)) {
      std::cerr << "Error processing " << f << ": cannot read " << path.string() << "\n";
      ++failed;
      continue;
    }
    uploads.push_back(std::move(upload));
  }

  const std::vector<FileReport> reports = scanplot::processBatch(uploads, args.pipeline);
  for (const auto& report : reports) {
    if (!report.ok) {
      std::cerr << "Error processing " << report.name << ": " << report.error << "\n";
      ++failed;
      continue;
    }

    std::cout << "\n==== " << report.title << " ====\n";
    std::cout << "Loaded " << report.block_count << " scan blocks from: " << report.name << "\n";
    if (report.summary.coordinates.isRagged()) {
      std::cout << "Note: coordinate rows differ in length; missing cells are left empty.\n";
    }

    std::cout << "\nMetadata\n";
    scanplot::printMetadata(std::cout, report.metadata);
    std::cout << "\nCoordinates summary\n";
    scanplot::printSummaryHead(std::cout, report.summary, args.head_rows);

    if (args.write_csv) {
      writeCsvOutputs(args, report);
    }
  }

  std::cout << "\n==== Batch summary ====\n";
  std::cout << "Files: " << args.files.size() << ", failed: " << failed << "\n";
  std::cout << "=======================\n";

  return (failed > 0) ? 3 : 0;
}
