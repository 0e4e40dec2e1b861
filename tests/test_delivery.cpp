// File: tests/test_delivery.cpp
#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "cogsim/adapters/file_export/file_record_sink.hpp"
#include "cogsim/core/io/delivery.hpp"
#include "cogsim/core/io/record_codec.hpp"
#include "cogsim/core/model/engine.hpp"
#include "test_support.hpp"

using namespace cogsim;
using cogsim::testing::make_profiles;
using cogsim::testing::make_test_request;
namespace fs = std::filesystem;

namespace {

// Rejects every third record; can also refuse to open.
class FlakySink final : public RecordSink {
 public:
  bool fail_open = false;
  int opened = 0;
  int flushed = 0;
  int closed = 0;
  std::vector<std::string> accepted;

  Status open() override {
    ++opened;
    if (fail_open) return Status::io_error("endpoint unreachable");
    return Status::ok_status();
  }
  Status submit(const SessionRecord& r) override {
    if (++calls_ % 3 == 0) return Status::io_error("rejected " + r.patient_id);
    accepted.push_back(r.patient_id);
    return Status::ok_status();
  }
  Status flush() override {
    ++flushed;
    return Status::ok_status();
  }
  void close() override { ++closed; }
  std::string name() const override { return "flaky"; }

 private:
  int calls_ = 0;
};

std::vector<SessionRecord> sample_records(SimulatorKind kind, std::size_t patients, int days) {
  const auto profiles = make_profiles(patients);
  auto r = generate_sessions(make_test_request(kind, patients, days), &profiles);
  REQUIRE(r.ok());
  return r.take_value().records;
}

std::string slurp(const std::string& path) {
  std::ifstream f(path);
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

std::vector<std::string> lines_of(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  for (std::string line; std::getline(in, line);) out.push_back(line);
  return out;
}

struct ScratchDir {
  fs::path path;
  explicit ScratchDir(const std::string& name) : path(fs::temp_directory_path() / name) { fs::remove_all(path); }
  ~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

}  // namespace

TEST_CASE("per-record failures are counted and delivery continues", "[delivery]") {
  const auto records = sample_records(SimulatorKind::kMemory, 3, 3);
  REQUIRE(records.size() == 9);

  FlakySink sink;
  std::vector<std::size_t> failed_at;
  auto r = deliver_records(records, sink, [&](std::size_t i, const Status& st) {
    CHECK(st.code() == Status::Code::kIoError);
    failed_at.push_back(i);
  });
  REQUIRE(r.ok());
  CHECK(r.value().submitted == 9);
  CHECK(r.value().succeeded == 6);
  CHECK(r.value().failed == 3);
  CHECK((failed_at == std::vector<std::size_t>{2, 5, 8}));
  CHECK(sink.flushed == 1);
  CHECK(sink.closed == 1);
}

TEST_CASE("open failure aborts delivery", "[delivery]") {
  FlakySink sink;
  sink.fail_open = true;
  auto r = deliver_records(sample_records(SimulatorKind::kMemory, 1, 2), sink);
  REQUIRE_FALSE(r.ok());
  CHECK(r.status().code() == Status::Code::kIoError);
  CHECK(r.status().message().find("flaky") != std::string::npos);
  CHECK(sink.accepted.empty());
}

TEST_CASE("empty batch still opens and flushes", "[delivery]") {
  FlakySink sink;
  auto r = deliver_records({}, sink);
  REQUIRE(r.ok());
  CHECK(r.value().submitted == 0);
  CHECK(sink.opened == 1);
  CHECK(sink.flushed == 1);
}

TEST_CASE("export format names", "[delivery][export]") {
  CHECK(parse_export_format("jsonl").ok());
  CHECK_FALSE(parse_export_format("parquet").ok());

  FileSinkConfig cfg;
  cfg.out_dir = "out";
  cfg.format = ExportFormat::kCsv;
  cfg.simulator = SimulatorKind::kExecutiveFunction;
  CHECK(FileRecordSink::dataset_path(cfg) == (fs::path("out") / "executive_function_dataset.csv").string());
}

TEST_CASE("json export is one valid array", "[delivery][export]") {
  ScratchDir dir("cogsim_test_export_json");
  const auto records = sample_records(SimulatorKind::kComposite, 2, 3);

  FileSinkConfig cfg;
  cfg.out_dir = dir.path.string();
  cfg.format = ExportFormat::kJson;
  cfg.simulator = SimulatorKind::kComposite;
  FileRecordSink sink(cfg);

  auto r = deliver_records(records, sink);
  REQUIRE(r.ok());
  CHECK(r.value().succeeded == records.size());
  CHECK(sink.written() == records.size());
  CHECK(fs::path(sink.path()).filename().string() == "composite_dataset.json");

  const std::string text = slurp(sink.path());
  CHECK(text.rfind("[\n  {\n", 0) == 0);
  CHECK(text.substr(text.size() - 3) == "\n]\n");

  const YAML::Node doc = YAML::Load(text);
  REQUIRE(doc.IsSequence());
  REQUIRE(doc.size() == records.size());
  CHECK(doc[0]["patient_id"].as<std::string>() == records[0].patient_id);
  CHECK(doc[0]["memory"]["immediate_recall"].IsDefined());
}

TEST_CASE("empty json export is an empty array", "[delivery][export]") {
  ScratchDir dir("cogsim_test_export_empty");
  FileSinkConfig cfg;
  cfg.out_dir = dir.path.string();
  FileRecordSink sink(cfg);
  REQUIRE(deliver_records({}, sink).ok());
  CHECK(slurp(sink.path()) == "[]\n");
}

TEST_CASE("jsonl export has one compact record per line", "[delivery][export]") {
  ScratchDir dir("cogsim_test_export_jsonl");
  const auto records = sample_records(SimulatorKind::kLanguage, 2, 4);

  FileSinkConfig cfg;
  cfg.out_dir = dir.path.string();
  cfg.format = ExportFormat::kJsonl;
  cfg.simulator = SimulatorKind::kLanguage;
  FileRecordSink sink(cfg);
  REQUIRE(deliver_records(records, sink).ok());

  const auto lines = lines_of(slurp(sink.path()));
  REQUIRE(lines.size() == records.size());
  for (std::size_t i = 0; i < lines.size(); ++i) {
    CHECK(lines[i] == encode_record_json(records[i], SimulatorKind::kLanguage));
  }
}

TEST_CASE("csv export writes one header row", "[delivery][export]") {
  ScratchDir dir("cogsim_test_export_csv");
  const auto records = sample_records(SimulatorKind::kMobility, 2, 2);

  FileSinkConfig cfg;
  cfg.out_dir = dir.path.string();
  cfg.format = ExportFormat::kCsv;
  cfg.simulator = SimulatorKind::kMobility;
  FileRecordSink sink(cfg);
  REQUIRE(deliver_records(records, sink).ok());

  const auto lines = lines_of(slurp(sink.path()));
  REQUIRE(lines.size() == records.size() + 1);
  CHECK(lines[0].rfind("device_id,patient_id,timestamp,domain,metrics_gait_speed_mps", 0) == 0);
}

TEST_CASE("file sink rejects submits outside open and flush", "[delivery][export]") {
  ScratchDir dir("cogsim_test_export_state");
  const auto records = sample_records(SimulatorKind::kMemory, 1, 1);

  FileSinkConfig cfg;
  cfg.out_dir = dir.path.string();
  cfg.simulator = SimulatorKind::kMemory;
  FileRecordSink sink(cfg);

  CHECK(sink.submit(records[0]).code() == Status::Code::kInternal);
  REQUIRE(sink.open().ok());
  CHECK(sink.submit(records[0]).ok());
  REQUIRE(sink.flush().ok());
  CHECK(sink.submit(records[0]).code() == Status::Code::kInternal);
  sink.close();
}
