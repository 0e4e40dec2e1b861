// File: src/core/events/jsonl_event_sink.cpp
#include "cogsim/core/events/jsonl_event_sink.hpp"

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

#include "cogsim/core/util/json_text.hpp"

namespace cogsim {
namespace {

// {"type":..,"t_ns":..,"t_s":..,"t_wall_ns":..,"t_wall_s":..   (object left open)
void begin_line(std::ostringstream& ss, const std::string& type, std::int64_t t_ns, std::int64_t wall_ns) {
  ss << std::fixed << std::setprecision(6);
  ss << "{\"type\":" << json_quote(type) << ",\"t_ns\":" << t_ns << ",\"t_s\":" << static_cast<double>(t_ns) * 1e-9
     << ",\"t_wall_ns\":" << wall_ns << ",\"t_wall_s\":" << static_cast<double>(wall_ns) * 1e-9;
}

}  // namespace

JsonlEventSink::~JsonlEventSink() { close(); }

Status JsonlEventSink::open(const RunInfo& run) {
  namespace fs = std::filesystem;
  close();

  std::error_code ec;
  fs::create_directories(run.out_dir, ec);
  if (ec) return Status::io_error("failed creating out_dir '" + run.out_dir + "': " + ec.message());

  const fs::path dir(run.out_dir);
  path_ = (dir / ("run_" + std::to_string(run.wall_start_time_ns.ns) + ".jsonl")).string();
  latest_path_ = (dir / "run_latest.jsonl").string();

  f_.open(path_, std::ios::out | std::ios::trunc);
  latest_.open(latest_path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open() || !latest_.is_open()) {
    close();
    return Status::io_error("failed opening run log in '" + run.out_dir + "'");
  }
  open_ = true;

  std::ostringstream ss;
  begin_line(ss, "run_started", run.start_time_ns.ns, run.wall_start_time_ns.ns);
  ss << ",\"tool\":" << json_quote(run.tool) << ",\"config_path\":" << json_quote(run.config_path)
     << ",\"config_hash\":" << json_quote(run.config_hash) << ",\"seed\":" << run.seed
     << ",\"seed_from_config\":" << (run.seed_from_config ? "true" : "false");
  if (!run.simulator.empty()) ss << ",\"simulator\":" << json_quote(run.simulator);
  ss << "}";

  COGSIM_RETURN_IF_ERROR(write_line_(ss.str()));
  return flush();
}

Status JsonlEventSink::emit(const Event& e) {
  if (!open_) return Status::invalid_argument("run log is not open (event '" + e.type + "')");

  std::ostringstream ss;
  begin_line(ss, e.type, e.t_ns.ns, e.t_wall_ns.ns);
  for (const auto& [key, value] : e.counts) ss << "," << json_quote(key) << ":" << value;
  for (const auto& [key, value] : e.attrs) ss << "," << json_quote(key) << ":" << json_quote(value);
  if (!e.message.empty()) ss << ",\"message\":" << json_quote(e.message);
  ss << "}";

  return write_line_(ss.str());
}

// Same line to the per-run file and to run_latest.jsonl.
Status JsonlEventSink::write_line_(const std::string& line) {
  f_ << line << '\n';
  latest_ << line << '\n';
  if (!f_ || !latest_) return Status::io_error("failed writing run log '" + path_ + "'");
  return Status::ok_status();
}

Status JsonlEventSink::flush() {
  if (!open_) return Status::ok_status();
  f_.flush();
  latest_.flush();
  if (!f_ || !latest_) return Status::io_error("failed flushing run log '" + path_ + "'");
  return Status::ok_status();
}

void JsonlEventSink::close() {
  f_.close();
  latest_.close();
  open_ = false;
}

}  // namespace cogsim
