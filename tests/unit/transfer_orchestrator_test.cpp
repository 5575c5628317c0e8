#include "internal/transfer/transfer_orchestrator.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "internal/storage/memory/memory_object_store.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using streamlift::model::ParseSegmentOrdinal;
using streamlift::model::UploadSession;
using streamlift::model::UploadStatus;
using streamlift::storage::MemoryObjectStore;
using streamlift::storage::ObjectStore;
using streamlift::storage::PutOptions;
using streamlift::storage::common::KeyLayout;
using streamlift::testing::FinalizeCall;
using streamlift::testing::RecordingFinalizer;
using streamlift::testing::RecordingStatusSink;
using streamlift::testing::TempDir;
using streamlift::transfer::TransferOrchestrator;
using streamlift::transfer::TransferRequest;
using streamlift::transfer::TransferSettings;

/*
  Wraps the memory store: segment puts are slowed down and their start/end
  order recorded; one segment can be made to fail.
*/
class InstrumentedStore final : public ObjectStore {
 public:
  struct Event {
    bool     start;
    uint32_t ordinal;
  };

  std::shared_ptr<MemoryObjectStore> inner = std::make_shared<MemoryObjectStore>();
  std::chrono::milliseconds          delay{0};
  std::optional<uint32_t>            fail_ordinal;

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& body, const PutOptions& options) override {
    auto ordinal = ParseSegmentOrdinal(key.substr(key.find_last_of('/') + 1));
    if (!ordinal) {
      inner->Put(key, body, options);
      return;
    }

    {
      std::lock_guard lock(mutex_);
      events_.push_back({true, *ordinal});
      ++in_flight_;
      max_in_flight_ = std::max(max_in_flight_, in_flight_);
    }
    if (delay.count() > 0) std::this_thread::sleep_for(delay);

    const bool fail = fail_ordinal && *fail_ordinal == *ordinal;
    if (!fail) inner->Put(key, body, options);
    {
      std::lock_guard lock(mutex_);
      events_.push_back({false, *ordinal});
      --in_flight_;
    }
    if (fail) throw streamlift::util::TransientIoError("injected failure for " + key);
  }

  std::vector<std::string> List(const std::string& prefix) override {
    return inner->List(prefix);
  }

  bool Head(const std::string& key) override {
    return inner->Head(key);
  }

  std::vector<Event> Events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

  size_t MaxInFlight() const {
    std::lock_guard lock(mutex_);
    return max_in_flight_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Event> events_;
  size_t             in_flight_     = 0;
  size_t             max_in_flight_ = 0;
};

struct Harness {
  TempDir                              dir{"orchestrator"};
  std::shared_ptr<InstrumentedStore>   store     = std::make_shared<InstrumentedStore>();
  std::shared_ptr<RecordingFinalizer>  finalizer = std::make_shared<RecordingFinalizer>();
  std::shared_ptr<RecordingStatusSink> sink      = std::make_shared<RecordingStatusSink>();
  KeyLayout                            layout{"media", "playlists"};
  TransferSettings                     settings;

  TransferRequest Request(uint32_t total, uint32_t resumed = 0, bool manifest_exists = false) {
    TransferRequest request;
    request.job                      = streamlift::testing::MakeJob("m-12");
    request.record                   = streamlift::testing::MakeSegments(dir.Path() / "segments", total);
    request.subtitle_dir             = (dir.Path() / "subtitles").string();
    request.manifest_artifacts_exist = manifest_exists;
    for (uint32_t i = 0; i < resumed; ++i) request.resume.insert(streamlift::model::SegmentFilename(i));
    return request;
  }

  void Run(const TransferRequest& request, UploadSession& session,
           const streamlift::util::CancellationToken& cancel = streamlift::util::CancellationToken()) {
    auto manifest = std::make_shared<streamlift::manifest::ManifestBuilder>(store, layout, finalizer);
    TransferOrchestrator       orchestrator(store, layout, manifest, settings);
    streamlift::progress::ProgressReporter reporter(sink, request.job, 15s);
    session.Transition(UploadStatus::kConverting);
    orchestrator.Run(request, session, reporter, cancel);
  }
};

std::vector<uint32_t> Counts(const std::vector<FinalizeCall>& calls) {
  std::vector<uint32_t> counts;
  for (const auto& call : calls) counts.push_back(call.segment_count);
  return counts;
}

void AssertMonotonicAndComplete(const std::vector<FinalizeCall>& calls, uint32_t total) {
  assert(!calls.empty());
  for (size_t i = 1; i < calls.size(); ++i) {
    assert(calls[i - 1].segment_count <= calls[i].segment_count);
  }
  assert(calls.back().segment_count == total);
  assert(calls.back().is_complete);
  for (size_t i = 0; i + 1 < calls.size(); ++i) {
    assert(calls[i].is_complete == (calls[i].segment_count >= total));
  }
}

void TestTwelveSegmentsWithThreeResumed() {
  Harness h;
  h.settings.priority_segments  = 5;
  h.settings.concurrent_uploads = 3;

  auto          request = h.Request(12, 3);
  UploadSession session("m-12", 0);
  h.Run(request, session);

  auto snapshot = session.Read();
  assert(snapshot.total_segments == 12);
  assert(snapshot.skipped_segments == 3);
  assert(snapshot.uploaded_segments == 12);
  assert(snapshot.transferred_this_run == 9);
  assert(snapshot.status == UploadStatus::kReadyForPlayback);

  // Resumed segments are never re-sent.
  for (uint32_t i = 0; i < 3; ++i) {
    assert(!h.store->inner->Head(h.layout.SegmentKey(request.job, streamlift::model::SegmentFilename(i))));
  }
  for (uint32_t i = 3; i < 12; ++i) {
    assert(h.store->inner->Head(h.layout.SegmentKey(request.job, streamlift::model::SegmentFilename(i))));
  }

  assert((Counts(h.finalizer->Calls()) == std::vector<uint32_t>{5, 8, 11, 12}));
  AssertMonotonicAndComplete(h.finalizer->Calls(), 12);

  // The template lists every segment, transferred now or before.
  const auto manifest = h.store->inner->GetString(h.layout.TemplateKey(request.job));
  assert(manifest.find("segment_000000.ts") != std::string::npos);
  assert(manifest.find("segment_000011.ts") != std::string::npos);
  assert(h.sink->HasStage("ready_for_playback"));
}

void TestSegmentMetadata() {
  Harness       h;
  auto          request = h.Request(2);
  UploadSession session("m-12", 0);
  h.Run(request, session);

  auto stored = h.store->inner->Get(h.layout.SegmentKey(request.job, "segment_000001.ts"));
  assert(stored.has_value());
  assert(stored->options.content_type == "video/mp2t");
  assert(stored->options.metadata.at("job-id") == "m-12");
  assert(stored->options.metadata.at("segment-index") == "1");
  assert(stored->options.metadata.at("total-segments") == "2");
}

void TestBulkBatchesAreBarriered() {
  Harness h;
  h.settings.priority_segments  = 2;
  h.settings.concurrent_uploads = 3;
  h.store->delay                = 20ms;

  auto          request = h.Request(11);
  UploadSession session("m-12", 0);
  h.Run(request, session);

  // Batch of ordinal i: 0 for the priority prefix, then one per C segments.
  auto batch_of = [&](uint32_t ordinal) -> uint32_t {
    return ordinal < 2 ? 0 : 1 + (ordinal - 2) / 3;
  };

  std::map<uint32_t, size_t> last_end_of_batch;
  std::map<uint32_t, size_t> first_start_of_batch;
  const auto                 events = h.store->Events();
  for (size_t i = 0; i < events.size(); ++i) {
    const auto batch = batch_of(events[i].ordinal);
    if (events[i].start) {
      if (!first_start_of_batch.count(batch)) first_start_of_batch[batch] = i;
    } else {
      last_end_of_batch[batch] = i;
    }
  }
  for (const auto& [batch, start] : first_start_of_batch) {
    if (batch == 0) continue;
    assert(last_end_of_batch.at(batch - 1) < start);
  }
  assert(h.store->MaxInFlight() <= 3);
  assert(session.Read().uploaded_segments == 11);
}

void TestFullyResumedWithManifestPresent() {
  Harness h;
  auto    request = h.Request(12, 12, /*manifest_exists=*/true);

  UploadSession session("m-12", 0);
  h.Run(request, session);

  assert(h.store->Events().empty());
  // Priority publish skipped; the 50% and 100% milestones still republish.
  assert((Counts(h.finalizer->Calls()) == std::vector<uint32_t>{8, 12}));
  AssertMonotonicAndComplete(h.finalizer->Calls(), 12);
  assert(session.Read().uploaded_segments == 12);
  assert(session.Read().transferred_this_run == 0);
}

void TestFullyResumedWithManifestMissing() {
  Harness h;
  auto    request = h.Request(12, 12, /*manifest_exists=*/false);

  UploadSession session("m-12", 0);
  h.Run(request, session);

  assert((Counts(h.finalizer->Calls()) == std::vector<uint32_t>{5, 8, 12}));
  assert(h.store->inner->Head(h.layout.TemplateKey(request.job)));
}

void TestPriorityCoversEverything() {
  Harness h;
  h.settings.priority_segments = 5;

  auto          request = h.Request(3);
  UploadSession session("m-12", 0);
  h.Run(request, session);

  auto calls = h.finalizer->Calls();
  assert(calls.size() == 1);
  assert(calls[0].segment_count == 3);
  assert(calls[0].is_complete);
}

void TestSegmentFailureThenIdempotentResume() {
  Harness h;
  h.settings.priority_segments  = 5;
  h.settings.concurrent_uploads = 3;
  h.store->fail_ordinal         = 9;

  auto          request = h.Request(12);
  UploadSession first("m-12", 0);
  bool          threw = false;
  try {
    h.Run(request, first);
  } catch (const streamlift::util::TransientIoError&) {
    threw = true;
  }
  assert(threw);
  assert((Counts(h.finalizer->Calls()) == std::vector<uint32_t>{5, 8}));

  // Second run resumes from what the first left behind.
  h.store->fail_ordinal = std::nullopt;
  streamlift::resume::RemoteStateProbe probe(h.store, h.layout);
  request.resume                   = probe.ExistingSegments(request.job);
  request.manifest_artifacts_exist = probe.ManifestArtifactsExist(request.job);
  assert(request.resume.size() == 10);
  assert(request.resume.count("segment_000009.ts") == 0);

  const auto    puts_before  = h.store->Events().size();
  const auto    calls_before = h.finalizer->Calls().size();
  UploadSession second("m-12", 0);
  h.Run(request, second);

  auto snapshot = second.Read();
  assert(snapshot.skipped_segments == 10);
  assert(snapshot.transferred_this_run == 2);
  assert(snapshot.uploaded_segments == 12);
  assert(h.store->Events().size() - puts_before == 4);

  // No finalized manifest remotely, so the second run republishes from the prefix.
  auto calls = h.finalizer->Calls();
  calls.erase(calls.begin(), calls.begin() + static_cast<std::ptrdiff_t>(calls_before));
  assert((Counts(calls) == std::vector<uint32_t>{5, 8, 11, 12}));
  AssertMonotonicAndComplete(calls, 12);
}

void TestCancellationStopsBeforeTransfer() {
  Harness                            h;
  auto                               request = h.Request(4);
  streamlift::util::CancellationToken cancel;
  cancel.Cancel();

  UploadSession session("m-12", 0);
  bool          threw = false;
  try {
    h.Run(request, session, cancel);
  } catch (const streamlift::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
  assert(h.store->Events().empty());
}

void TestSubtitlesUploadedBestEffort() {
  Harness h;
  auto    request = h.Request(2);

  auto* present = request.record.add_subtitles();
  present->set_filename("embedded_3.en.vtt");
  present->set_language("en");
  auto* missing = request.record.add_subtitles();
  missing->set_filename("search_0.en.vtt");
  missing->set_language("en");
  streamlift::testing::WriteFile(h.dir.Path() / "subtitles" / "embedded_3.en.vtt", "WEBVTT\n\n");

  UploadSession session("m-12", 0);
  h.Run(request, session);

  auto stored = h.store->inner->Get(h.layout.SubtitleKey(request.job, "embedded_3.en.vtt"));
  assert(stored.has_value());
  assert(stored->options.content_type == "text/vtt");
  assert(!h.store->inner->Head(h.layout.SubtitleKey(request.job, "search_0.en.vtt")));
  assert(session.Read().uploaded_segments == 2);
}

} // namespace

int main() {
  TestTwelveSegmentsWithThreeResumed();
  TestSegmentMetadata();
  TestBulkBatchesAreBarriered();
  TestFullyResumedWithManifestPresent();
  TestFullyResumedWithManifestMissing();
  TestPriorityCoversEverything();
  TestSegmentFailureThenIdempotentResume();
  TestCancellationStopsBeforeTransfer();
  TestSubtitlesUploadedBestEffort();

  std::cout << "streamlift_unit_transfer_orchestrator: pass\n";
  return 0;
}
