#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/transfer_job.hpp"
#include "internal/util/time.hpp"

namespace streamlift::api {

/*
  External step that turns the published template into a client-servable
  playlist. segment_count is the number of ordinal-prefix entries listed.
*/
class ManifestFinalizer {
 public:
  virtual ~ManifestFinalizer() = default;

  virtual void Finalize(const model::TransferJob& job, uint32_t segment_count, uint32_t total_segments, bool is_complete) = 0;
};

struct StatusUpdate {
  double                         percentage = 0.0;
  std::string                    stage_name;
  std::string                    message;
  std::optional<util::TimePoint> eta;
};

class StatusSink {
 public:
  virtual ~StatusSink() = default;

  virtual void Push(const model::TransferJob& job, const StatusUpdate& update) = 0;
};

using ManifestFinalizerPtr = std::shared_ptr<ManifestFinalizer>;
using StatusSinkPtr        = std::shared_ptr<StatusSink>;

} // namespace streamlift::api
