// File: src/adapters/file_export/file_record_sink.cpp
#include "cogsim/adapters/file_export/file_record_sink.hpp"

#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include "cogsim/core/io/record_codec.hpp"

namespace cogsim {

Result<ExportFormat> parse_export_format(const std::string& s) {
  if (s == "json") return Result<ExportFormat>::ok(ExportFormat::kJson);
  if (s == "jsonl") return Result<ExportFormat>::ok(ExportFormat::kJsonl);
  if (s == "csv") return Result<ExportFormat>::ok(ExportFormat::kCsv);
  return Result<ExportFormat>::err(Status::invalid_argument("unknown output format: '" + s + "'"));
}

const char* export_extension(ExportFormat f) {
  switch (f) {
    case ExportFormat::kJson: return "json";
    case ExportFormat::kJsonl: return "jsonl";
    case ExportFormat::kCsv: return "csv";
  }
  return "dat";
}

FileRecordSink::FileRecordSink(FileSinkConfig cfg) : cfg_(std::move(cfg)) {}

FileRecordSink::~FileRecordSink() { close(); }

std::string FileRecordSink::dataset_path(const FileSinkConfig& cfg) {
  namespace fs = std::filesystem;
  const std::string file = std::string(simulator_name(cfg.simulator)) + "_dataset." + export_extension(cfg.format);
  return (fs::path(cfg.out_dir) / file).string();
}

Status FileRecordSink::open() {
  close();

  std::error_code ec;
  std::filesystem::create_directories(cfg_.out_dir, ec);
  if (ec) {
    return Status::io_error("failed creating out_dir '" + cfg_.out_dir + "': " + ec.message());
  }

  path_ = dataset_path(cfg_);
  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  open_ = true;
  finished_ = false;
  written_ = 0;

  if (cfg_.format == ExportFormat::kJson) f_ << "[";
  return Status::ok_status();
}

Status FileRecordSink::submit(const SessionRecord& r) {
  if (!open_) return Status::internal("FileRecordSink: submit before open");
  if (finished_) return Status::internal("FileRecordSink: submit after flush");

  switch (cfg_.format) {
    case ExportFormat::kJson:
      f_ << (written_ ? ",\n" : "\n") << "  " << encode_record_json(r, cfg_.simulator, 2, 1);
      break;
    case ExportFormat::kJsonl:
      f_ << encode_record_json(r, cfg_.simulator) << "\n";
      break;
    case ExportFormat::kCsv: {
      const std::vector<RecordField> fields = flatten_record(r, cfg_.simulator);
      if (written_ == 0) f_ << csv_header(fields) << "\n";
      f_ << csv_row(fields) << "\n";
      break;
    }
  }

  if (!f_.good()) return Status::io_error("failed writing '" + path_ + "'");
  ++written_;
  return Status::ok_status();
}

Status FileRecordSink::flush() {
  if (!open_) return Status::ok_status();
  if (!finished_ && cfg_.format == ExportFormat::kJson) f_ << (written_ ? "\n]\n" : "]\n");
  finished_ = true;
  f_.flush();
  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  return Status::ok_status();
}

void FileRecordSink::close() {
  if (!open_) return;
  if (!finished_) (void)flush();
  f_.close();
  open_ = false;
}

}  // namespace cogsim
