#include "internal/model/upload_session.hpp"

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using streamlift::model::CanTransition;
using streamlift::model::UploadSession;
using streamlift::model::UploadStatus;

void TestHappyPathTransitions() {
  UploadSession session("job", 1024);
  session.Transition(UploadStatus::kConverting);
  session.Transition(UploadStatus::kUploading);
  session.Transition(UploadStatus::kReadyForPlayback);
  session.Transition(UploadStatus::kCompleted);
  assert(session.Status() == UploadStatus::kCompleted);
}

void TestIllegalTransitionThrows() {
  UploadSession session("job", 0);
  bool          threw = false;
  try {
    session.Transition(UploadStatus::kReadyForPlayback);
  } catch (const streamlift::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(session.Status() == UploadStatus::kPending);
}

void TestTerminalStatesAreFinal() {
  assert(!CanTransition(UploadStatus::kCompleted, UploadStatus::kFailed));
  assert(!CanTransition(UploadStatus::kFailed, UploadStatus::kUploading));
  assert(CanTransition(UploadStatus::kUploading, UploadStatus::kFailed));
  assert(CanTransition(UploadStatus::kPending, UploadStatus::kUsingExistingConversion));
}

void TestResumeCountsTowardUploaded() {
  UploadSession session("job", 0);
  session.SetTotalSegments(12);
  session.SetResumeCount(3);

  auto snapshot = session.Read();
  assert(snapshot.skipped_segments == 3);
  assert(snapshot.uploaded_segments == 3);
  assert(snapshot.transferred_this_run == 0);

  assert(session.RecordTransferred(100) == 4);
  snapshot = session.Read();
  assert(snapshot.transferred_this_run == 1);
  assert(snapshot.transferred_bytes == 100);
  assert(session.ProgressPercent() == 33.3);
}

void TestConcurrentRecordsAreCounted() {
  UploadSession session("job", 0);
  session.SetTotalSegments(400);

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 100; ++i) session.RecordTransferred(1);
    });
  }
  for (auto& thread : threads) thread.join();

  assert(session.Read().uploaded_segments == 400);
  assert(session.ProgressPercent() == 100.0);
}

void TestProgressIsZeroWithoutTotal() {
  UploadSession session("job", 0);
  assert(session.ProgressPercent() == 0.0);
}

} // namespace

int main() {
  TestHappyPathTransitions();
  TestIllegalTransitionThrows();
  TestTerminalStatesAreFinal();
  TestResumeCountsTowardUploaded();
  TestConcurrentRecordsAreCounted();
  TestProgressIsZeroWithoutTotal();

  std::cout << "streamlift_unit_upload_session: pass\n";
  return 0;
}
