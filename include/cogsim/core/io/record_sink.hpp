// File: include/cogsim/core/io/record_sink.hpp
#pragma once

#include <string>

#include "cogsim/core/io/session_record.hpp"
#include "cogsim/core/status.hpp"

namespace cogsim {

// Downstream consumer of generated records (file export, ingestion endpoint).
class RecordSink {
 public:
  virtual ~RecordSink() = default;

  virtual Status open() = 0;

  // One record at a time. A failure concerns this record only; the caller
  // counts it and keeps going.
  virtual Status submit(const SessionRecord& r) = 0;

  virtual Status flush() = 0;
  virtual void close() = 0;

  virtual std::string name() const = 0;
};

}  // namespace cogsim
