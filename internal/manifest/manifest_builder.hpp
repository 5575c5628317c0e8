#pragma once

#include <google/protobuf/repeated_field.h>

#include <cstdint>
#include <string>

#include "internal/api/media_api.hpp"
#include "internal/model/transfer_job.hpp"
#include "internal/storage/common/key_layout.hpp"
#include "internal/storage/object_store.hpp"
#include "streamlift/v1/conversion.pb.h"

namespace streamlift::manifest {

using SegmentList = google::protobuf::RepeatedPtrField<streamlift::v1::SegmentEntry>;

/*
  Renders the template playlist for the ordinal prefix [0, count):

      #EXTM3U
      #EXT-X-VERSION:3
      #EXT-X-TARGETDURATION:10
      #EXT-X-MEDIA-SEQUENCE:0
      #EXTINF:10.0,
      segment_000000.ts
      ...

  Never carries #EXT-X-ENDLIST; completeness is decided by the finalizer.
*/
std::string RenderTemplate(const SegmentList& segments, uint32_t count);

class ManifestBuilder {
 public:
  ManifestBuilder(storage::ObjectStorePtr store, storage::common::KeyLayout layout, api::ManifestFinalizerPtr finalizer);

  // Writes the template listing the first count segments.
  void PublishTemplate(const model::TransferJob& job, const SegmentList& segments, uint32_t count);

  // is_complete = count >= total.
  void NotifyFinalize(const model::TransferJob& job, uint32_t count, uint32_t total);

 private:
  storage::ObjectStorePtr    store_;
  storage::common::KeyLayout layout_;
  api::ManifestFinalizerPtr  finalizer_;
};

} // namespace streamlift::manifest
