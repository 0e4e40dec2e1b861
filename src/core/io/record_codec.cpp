// File: src/core/io/record_codec.cpp
#include "cogsim/core/io/record_codec.hpp"

#include <sstream>
#include <type_traits>

#include "cogsim/core/model/simulator.hpp"
#include "cogsim/core/util/civil_time.hpp"
#include "cogsim/core/util/json_text.hpp"

namespace cogsim {
namespace {

class FieldList {
 public:
  explicit FieldList(std::vector<RecordField>& out) : out_(out) {}

  void group(std::string g) { group_ = std::move(g); }

  void str(const std::string& key, const std::string& v) { out_.push_back(RecordField{group_, key, v, true}); }
  void num(const std::string& key, long long v) {
    out_.push_back(RecordField{group_, key, std::to_string(v), false});
  }
  void real(const std::string& key, double v, int decimals = 2) {
    out_.push_back(RecordField{group_, key, format_fixed(v, decimals), false});
  }
  void flag(const std::string& key, bool v) { out_.push_back(RecordField{group_, key, v ? "true" : "false", false}); }

 private:
  std::vector<RecordField>& out_;
  std::string group_;
};

void add_metrics(FieldList& f, const CompositeMetrics& m) {
  f.group("attention");
  f.num("digit_span_max", m.attention.digit_span_max);
  f.num("errors", m.attention.errors);
  f.real("latency_sec", m.attention.latency_sec);

  f.group("executive_function");
  f.num("verbal_fluency_words", m.executive_function.verbal_fluency_words);
  f.real("articulation_rate_wps", m.executive_function.articulation_rate_wps);
  f.num("avg_pause_ms", m.executive_function.avg_pause_ms);

  f.group("memory");
  f.num("immediate_recall", m.memory.immediate_recall);
  f.num("delayed_recall", m.memory.delayed_recall);
  f.num("intrusion_errors", m.memory.intrusion_errors);

  f.group("orientation");
  f.flag("date_correct", m.orientation.date_correct);
  f.flag("city_correct", m.orientation.city_correct);
  f.num("orientation_correct", m.orientation.orientation_correct);

  f.group("processing_speed");
  f.num("avg_reaction_time_ms", m.processing_speed.avg_reaction_time_ms);
  f.num("missed_trials", m.processing_speed.missed_trials);

  f.group("mood_behavior");
  f.real("sentiment_score", m.mood_behavior.sentiment_score);
  f.real("narrative_coherence", m.mood_behavior.narrative_coherence);
  f.num("mood_score", m.mood_behavior.mood_score);
}

void add_metrics(FieldList& f, const ExecutiveFunctionMetrics& m) {
  f.num("tmt_b_completion_sec", m.tmt_b_completion_sec);
  f.num("errors", m.errors);
  f.num("symbol_digit_correct", m.symbol_digit_correct);
}

void add_metrics(FieldList& f, const MemoryMetrics& m) {
  f.num("immediate_recall_correct", m.immediate_recall_correct);
  f.num("delayed_recall_correct", m.delayed_recall_correct);
  f.num("intrusion_errors", m.intrusion_errors);
}

void add_metrics(FieldList& f, const LanguageMetrics& m) {
  f.num("verbal_fluency_words", m.verbal_fluency_words);
  f.num("avg_pause_ms", m.avg_pause_ms);
  f.real("articulation_rate_wps", m.articulation_rate_wps);
  f.real("sentiment_score", m.sentiment_score);
}

void add_metrics(FieldList& f, const MobilityMetrics& m) {
  f.real("gait_speed_mps", m.gait_speed_mps);
  f.real("stride_variability_pct", m.stride_variability_pct, 1);
  f.num("daily_steps", m.daily_steps);
  f.flag("fall_detected", m.fall_detected);
}

std::string csv_cell(const std::string& s) {
  if (s.find_first_of(",\"\n\r") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out.push_back(c);
  }
  out += "\"";
  return out;
}

}  // namespace

std::vector<RecordField> flatten_record(const SessionRecord& r, SimulatorKind kind) {
  std::vector<RecordField> out;
  FieldList f(out);

  f.str("device_id", r.device_id);
  f.str("patient_id", r.patient_id);

  const std::string stamp = format_iso_datetime(r.timestamp, r.utc_suffix);
  if (kind == SimulatorKind::kComposite) {
    f.str("session_date", stamp);
    std::visit([&](const auto& m) { add_metrics(f, m); }, r.metrics);
    return out;
  }

  f.str("timestamp", stamp);
  f.str("domain", domain_tag(kind));
  f.group("metrics");
  std::visit([&](const auto& m) { add_metrics(f, m); }, r.metrics);
  f.group("");

  if (r.signal_quality) f.real("signal_quality", *r.signal_quality);
  const TaskLabel label = task_label(kind);
  if (label.key[0] != '\0') f.str(label.key, label.value);
  return out;
}

std::string encode_record_json(const SessionRecord& r, SimulatorKind kind, int indent, int depth) {
  const std::vector<RecordField> fields = flatten_record(r, kind);
  const bool pretty = indent > 0;
  const std::string nl = pretty ? "\n" : "";
  const std::string sep = pretty ? ": " : ":";
  auto pad = [&](int level) { return pretty ? std::string(static_cast<std::size_t>(indent * level), ' ') : ""; };

  std::ostringstream ss;
  ss << "{" << nl;

  std::string open_group;
  bool first_top = true;
  bool first_in_group = true;
  for (const RecordField& fld : fields) {
    if (fld.group != open_group) {
      if (!open_group.empty()) ss << nl << pad(depth + 1) << "}";
      open_group = fld.group;
      if (!open_group.empty()) {
        if (!first_top) ss << "," << nl;
        ss << pad(depth + 1) << json_quote(open_group) << sep << "{" << nl;
        first_top = false;
        first_in_group = true;
      }
    }

    if (open_group.empty()) {
      if (!first_top) ss << "," << nl;
      ss << pad(depth + 1);
      first_top = false;
    } else {
      if (!first_in_group) ss << "," << nl;
      ss << pad(depth + 2);
      first_in_group = false;
    }
    ss << json_quote(fld.key) << sep << (fld.quoted ? json_quote(fld.text) : fld.text);
  }
  if (!open_group.empty()) ss << nl << pad(depth + 1) << "}";

  ss << nl << pad(depth) << "}";
  return ss.str();
}

std::string csv_header(const std::vector<RecordField>& fields) {
  std::string out;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i) out.push_back(',');
    const RecordField& f = fields[i];
    out += csv_cell(f.group.empty() ? f.key : f.group + "_" + f.key);
  }
  return out;
}

std::string csv_row(const std::vector<RecordField>& fields) {
  std::string out;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i) out.push_back(',');
    out += csv_cell(fields[i].text);
  }
  return out;
}

}  // namespace cogsim
