// File: src/core/io/delivery.cpp
#include "cogsim/core/io/delivery.hpp"

namespace cogsim {

Result<DeliveryReport> deliver_records(const std::vector<SessionRecord>& records, RecordSink& sink,
                                       const DeliveryFailureFn& on_failure) {
  const Status st_open = sink.open();
  if (!st_open.ok()) return Result<DeliveryReport>::err(st_open.annotate(sink.name()));

  DeliveryReport rep;
  for (std::size_t i = 0; i < records.size(); ++i) {
    ++rep.submitted;
    const Status st = sink.submit(records[i]);
    if (st.ok()) {
      ++rep.succeeded;
      continue;
    }
    ++rep.failed;
    if (on_failure) on_failure(i, st);
  }

  const Status st_flush = sink.flush();
  sink.close();
  if (!st_flush.ok()) return Result<DeliveryReport>::err(st_flush.annotate(sink.name()));

  return Result<DeliveryReport>::ok(rep);
}

}  // namespace cogsim
