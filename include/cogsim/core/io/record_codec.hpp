// File: include/cogsim/core/io/record_codec.hpp
#pragma once

#include <string>
#include <vector>

#include "cogsim/core/io/session_record.hpp"
#include "cogsim/core/types.hpp"

namespace cogsim {

// One leaf of a record in output order. `group` names the enclosing object
// ("metrics", "attention", ...) and is empty for top-level fields.
struct RecordField {
  std::string group;
  std::string key;
  std::string text;     // value already formatted (numbers fixed-point, bools true/false)
  bool quoted = false;  // JSON string
};

// Single-domain: device_id, patient_id, timestamp, domain, metrics{...},
//                signal_quality, task_type|test_type.
// Composite:     device_id, patient_id, session_date, six domain blocks.
std::vector<RecordField> flatten_record(const SessionRecord& r, SimulatorKind kind);

// indent == 0: one compact line (JSONL, digests).
// indent > 0: pretty printed, nested `depth` levels deep (depth 1 inside an array).
std::string encode_record_json(const SessionRecord& r, SimulatorKind kind, int indent = 0, int depth = 0);

// Nested groups are flattened as "<group>_<key>".
std::string csv_header(const std::vector<RecordField>& fields);
std::string csv_row(const std::vector<RecordField>& fields);

}  // namespace cogsim
