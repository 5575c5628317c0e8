#include "internal/resume/remote_state_probe.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/storage/memory/memory_object_store.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using streamlift::resume::RemoteStateProbe;
using streamlift::storage::MemoryObjectStore;
using streamlift::storage::ObjectStore;
using streamlift::storage::PutOptions;
using streamlift::storage::common::KeyLayout;

class FailingStore final : public ObjectStore {
 public:
  void Put(const std::string&, const std::shared_ptr<arrow::Buffer>&, const PutOptions&) override {
    throw streamlift::util::TransientIoError("put failed");
  }
  std::vector<std::string> List(const std::string&) override {
    throw streamlift::util::TransientIoError("list failed");
  }
  bool Head(const std::string&) override {
    throw streamlift::util::TransientIoError("head failed");
  }
};

void Put(MemoryObjectStore& store, const std::string& key) {
  store.Put(key, arrow::Buffer::FromString("x"), PutOptions{});
}

void TestExistingSegmentsKeepsOnlySegmentNames() {
  auto      store = std::make_shared<MemoryObjectStore>();
  KeyLayout layout("media", "playlists");
  auto      job = streamlift::testing::MakeJob("m-1");

  Put(*store, layout.SegmentKey(job, "segment_000000.ts"));
  Put(*store, layout.SegmentKey(job, "segment_000001.ts"));
  Put(*store, layout.SegmentPrefix(job) + "notes.txt");
  Put(*store, layout.SegmentKey(streamlift::testing::MakeJob("m-2"), "segment_000005.ts"));

  RemoteStateProbe probe(store, layout);
  auto             existing = probe.ExistingSegments(job);
  assert(existing.size() == 2);
  assert(existing.count("segment_000000.ts") == 1);
  assert(existing.count("segment_000001.ts") == 1);
}

void TestListingFailureMeansEmptyResumeSet() {
  RemoteStateProbe probe(std::make_shared<FailingStore>(), KeyLayout("media", "playlists"));
  auto             job = streamlift::testing::MakeJob();
  assert(probe.ExistingSegments(job).empty());
  assert(!probe.ManifestArtifactsExist(job));
}

void TestManifestArtifactsRequireBoth() {
  auto      store = std::make_shared<MemoryObjectStore>();
  KeyLayout layout("media", "playlists");
  auto      job = streamlift::testing::MakeJob();

  RemoteStateProbe probe(store, layout);
  assert(!probe.ManifestArtifactsExist(job));

  Put(*store, layout.TemplateKey(job));
  assert(!probe.ManifestArtifactsExist(job));

  Put(*store, layout.FinalManifestKey(job));
  assert(probe.ManifestArtifactsExist(job));
}

} // namespace

int main() {
  TestExistingSegmentsKeepsOnlySegmentNames();
  TestListingFailureMeansEmptyResumeSet();
  TestManifestArtifactsRequireBoth();

  std::cout << "streamlift_unit_remote_state_probe: pass\n";
  return 0;
}
