// File: include/cogsim/core/io/delivery.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "cogsim/core/io/record_sink.hpp"
#include "cogsim/core/io/session_record.hpp"
#include "cogsim/core/status.hpp"

namespace cogsim {

struct DeliveryReport {
  std::size_t submitted = 0;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
};

// Called for every rejected record with its position in the batch.
using DeliveryFailureFn = std::function<void(std::size_t index, const Status& st)>;

// Opens the sink, submits every record, flushes and closes.
// Per-record failures are counted and reported through `on_failure`; the
// loop continues. Only open() and flush() failures are returned as errors.
Result<DeliveryReport> deliver_records(const std::vector<SessionRecord>& records, RecordSink& sink,
                                       const DeliveryFailureFn& on_failure = nullptr);

}  // namespace cogsim
