// File: include/cogsim/adapters/file_export/file_record_sink.hpp
#pragma once

#include <cstddef>
#include <fstream>
#include <string>

#include "cogsim/core/io/record_sink.hpp"
#include "cogsim/core/types.hpp"

namespace cogsim {

enum class ExportFormat {
  kJson,   // one pretty-printed array
  kJsonl,  // one compact object per line
  kCsv,    // header from the first record, nested groups flattened
};

Result<ExportFormat> parse_export_format(const std::string& s);
const char* export_extension(ExportFormat f);

struct FileSinkConfig {
  std::string out_dir{"out"};
  ExportFormat format{ExportFormat::kJson};
  SimulatorKind simulator{SimulatorKind::kComposite};
};

// Writes records to <out_dir>/<simulator>_dataset.<ext>, replacing any
// previous export. flush() completes the document (closes the JSON array);
// submits after that are rejected.
class FileRecordSink final : public RecordSink {
 public:
  explicit FileRecordSink(FileSinkConfig cfg);
  ~FileRecordSink() override;

  Status open() override;
  Status submit(const SessionRecord& r) override;
  Status flush() override;
  void close() override;

  std::string name() const override { return "file_export"; }

  const std::string& path() const { return path_; }
  std::size_t written() const { return written_; }

  static std::string dataset_path(const FileSinkConfig& cfg);

 private:
  FileSinkConfig cfg_;
  std::string path_;
  std::ofstream f_;

  bool open_{false};
  bool finished_{false};
  std::size_t written_{0};
};

}  // namespace cogsim
