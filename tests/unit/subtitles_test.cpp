#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <sstream>

#include "internal/subtitles/archive.hpp"
#include "internal/subtitles/srt_to_vtt.hpp"
#include "internal/subtitles/subtitle_resolver.hpp"
#include "internal/subtitles/title_parser.hpp"
#include "internal/subtitles/track_selection.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;

using namespace streamlift::subtitles;
using streamlift::testing::TempDir;
using streamlift::transcode::MediaInfo;
using streamlift::transcode::SubtitleStream;

std::string ReadAll(const fs::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

SubtitleStream Stream(int index, const std::string& codec, const std::string& language, const std::string& title = "") {
  SubtitleStream stream;
  stream.index    = index;
  stream.codec    = codec;
  stream.language = language;
  stream.title    = title;
  return stream;
}

class FakeTranscoder final : public streamlift::transcode::Transcoder {
 public:
  std::set<int> failing;

  MediaInfo Probe(const std::string&, const streamlift::util::CancellationToken&) override {
    return {};
  }

  streamlift::transcode::TranscodeResult Transcode(const std::string&, const std::string&, const streamlift::transcode::CodecPlan&,
                                                   const streamlift::transcode::ProgressCallback&,
                                                   const streamlift::util::CancellationToken&) override {
    throw streamlift::util::TransientIoError("not used");
  }

  void ExtractSubtitle(const std::string&, int stream_index, const std::string& output_path, const streamlift::util::CancellationToken&) override {
    if (failing.count(stream_index) > 0) throw streamlift::util::TransientIoError("extract failed");
    streamlift::testing::WriteFile(output_path, "WEBVTT\n\n00:00:01.000 --> 00:00:02.000\nembedded\n\n");
  }

  std::string CheckAvailable() override {
    return "fake";
  }
};

class FakeSearch final : public SubtitleSearchClient {
 public:
  std::vector<std::string>         urls;
  std::map<std::string, std::string> bodies;
  std::string                      last_title;
  std::optional<int>               last_year;
  std::atomic<int>                 downloads{0};
  bool                             fail_search = false;

  std::vector<streamlift::v1::SubtitleCandidate> Search(const std::string& title, std::optional<int> year) override {
    last_title = title;
    last_year  = year;
    if (fail_search) throw streamlift::util::TransientIoError("search down");
    std::vector<streamlift::v1::SubtitleCandidate> out;
    for (const auto& url : urls) {
      streamlift::v1::SubtitleCandidate candidate;
      candidate.set_download_url(url);
      out.push_back(candidate);
    }
    return out;
  }

  std::string Download(const std::string& url) override {
    ++downloads;
    auto it = bodies.find(url);
    if (it == bodies.end()) throw streamlift::util::TransientIoError("404 " + url);
    return it->second;
  }
};

void TestSrtToVtt() {
  const std::string srt =
      "\xEF\xBB\xBF"
      "1\r\n00:00:01,500 --> 00:00:03,000\r\nHello, world\r\n\r\n"
      "2\r\n00:00:04,000 --> 00:00:05,250\r\nLine one\r\nLine two\r\n\r\n\r\n";

  const std::string expected =
      "WEBVTT\n\n"
      "00:00:01.500 --> 00:00:03.000\nHello, world\n\n"
      "00:00:04.000 --> 00:00:05.250\nLine one\nLine two\n\n";
  assert(SrtToVtt(srt) == expected);

  // No trailing blank line in the input.
  assert(SrtToVtt("1\n00:00:00,000 --> 00:00:01,000\nx") == "WEBVTT\n\n00:00:00.000 --> 00:00:01.000\nx\n\n");
  assert(SrtToVtt("") == "WEBVTT\n\n");
}

void TestIsWebVtt() {
  assert(IsWebVtt("WEBVTT\n\n"));
  assert(IsWebVtt("\xEF\xBB\xBFWEBVTT - title\n"));
  assert(!IsWebVtt("1\n00:00:01,000 --> 00:00:02,000\n"));
}

void TestParseTitle() {
  auto parsed = ParseTitle("The.Matrix.1999.1080p.BluRay");
  assert(parsed.title == "The Matrix");
  assert(parsed.year == 1999);

  parsed = ParseTitle("Blade_Runner_2049_(2017)");
  assert(parsed.title == "Blade Runner");
  assert(parsed.year == 2049);

  parsed = ParseTitle("1917.2019.720p");
  assert(parsed.title == "1917");
  assert(parsed.year == 2019);

  parsed = ParseTitle("home_movie");
  assert(parsed.title == "home movie");
  assert(!parsed.year.has_value());
}

void TestSelectEnglishTracks() {
  auto selected = SelectEnglishTracks({Stream(2, "subrip", "fre"), Stream(3, "subrip", "eng"), Stream(4, "hdmv_pgs_subtitle", "eng"),
                                       Stream(5, "ass", "", "English (forced)")});
  assert(selected.size() == 2);
  assert(selected[0].index == 3);
  assert(selected[1].index == 5);

  // Untagged file: first text track.
  selected = SelectEnglishTracks({Stream(2, "dvd_subtitle", ""), Stream(3, "mov_text", ""), Stream(4, "subrip", "")});
  assert(selected.size() == 1);
  assert(selected[0].index == 3);

  // Tagged but no English.
  assert(SelectEnglishTracks({Stream(2, "subrip", "ger")}).empty());
}

void TestIsZipArchive() {
  assert(IsZipArchive(std::string("PK\x03\x04rest", 8)));
  assert(!IsZipArchive("PK"));
  assert(!IsZipArchive("WEBVTT"));
}

void TestResolverPrefersEmbedded() {
  TempDir dir("subtitles");
  auto    transcoder = std::make_shared<FakeTranscoder>();
  auto    search     = std::make_shared<FakeSearch>();
  transcoder->failing.insert(7);

  MediaInfo info;
  info.subtitle_streams = {Stream(3, "subrip", "eng"), Stream(7, "subrip", "en")};

  SubtitleResolver resolver(transcoder, search, SubtitleSettings{});
  auto             entries = resolver.Resolve("m-1", "/lib/The.Matrix.1999.mkv", info, dir.Str(), {});

  assert(entries.size() == 1);
  assert(entries[0].filename() == "embedded_3.en.vtt");
  assert(entries[0].origin() == "embedded");
  assert(entries[0].language() == "en");
  assert(fs::exists(dir.Path() / "embedded_3.en.vtt"));
  assert(search->downloads == 0);
}

void TestResolverFallsBackToSearch() {
  TempDir dir("subtitles_search");
  auto    search = std::make_shared<FakeSearch>();
  search->urls   = {"u0", "u1", "u2"};
  search->bodies = {
      {"u0", "1\n00:00:01,000 --> 00:00:02,000\nfrom srt\n"},
      {"u2", "WEBVTT\n\n00:00:01.000 --> 00:00:02.000\nalready vtt\n\n"},
  };

  SubtitleResolver resolver(std::make_shared<FakeTranscoder>(), search, SubtitleSettings{});
  auto             entries = resolver.Resolve("m-1", "/lib/The.Matrix.1999.1080p.mkv", MediaInfo{}, dir.Str(), {});

  assert(search->last_title == "The Matrix");
  assert(search->last_year == 1999);
  assert(search->downloads == 3);
  assert(entries.size() == 2);
  assert(entries[0].filename() == "search_0.en.vtt");
  assert(entries[1].filename() == "search_2.en.vtt");
  assert(entries[0].origin() == "search");

  assert(ReadAll(dir.Path() / "search_0.en.vtt") == "WEBVTT\n\n00:00:01.000 --> 00:00:02.000\nfrom srt\n\n");
  assert(ReadAll(dir.Path() / "search_2.en.vtt") == search->bodies["u2"]);
}

void TestResolverCapsCandidates() {
  TempDir dir("subtitles_cap");
  auto    search = std::make_shared<FakeSearch>();
  for (int i = 0; i < 8; ++i) search->urls.push_back("u" + std::to_string(i));

  SubtitleSettings settings;
  settings.max_candidates = 2;
  SubtitleResolver resolver(std::make_shared<FakeTranscoder>(), search, settings);
  auto             entries = resolver.Resolve("m-1", "/lib/Heat.1995.mkv", MediaInfo{}, dir.Str(), {});

  assert(entries.empty());
  assert(search->downloads == 2);
}

void TestResolverNeverThrowsOnSearchFailure() {
  TempDir dir("subtitles_fail");
  auto    search     = std::make_shared<FakeSearch>();
  search->fail_search = true;

  SubtitleResolver resolver(std::make_shared<FakeTranscoder>(), search, SubtitleSettings{});
  assert(resolver.Resolve("m-1", "/lib/Heat.1995.mkv", MediaInfo{}, dir.Str(), {}).empty());

  // No search service, no embedded tracks.
  SubtitleResolver without_search(std::make_shared<FakeTranscoder>(), nullptr, SubtitleSettings{});
  assert(without_search.Resolve("m-1", "/lib/Heat.1995.mkv", MediaInfo{}, dir.Str(), {}).empty());
}

void TestResolverDisabled() {
  TempDir dir("subtitles_off");
  MediaInfo info;
  info.subtitle_streams = {Stream(3, "subrip", "eng")};

  SubtitleSettings settings;
  settings.enabled = false;
  SubtitleResolver resolver(std::make_shared<FakeTranscoder>(), nullptr, settings);
  assert(resolver.Resolve("m-1", "/lib/x.mkv", info, dir.Str(), {}).empty());
}

void TestResolverPropagatesCancellation() {
  TempDir dir("subtitles_cancel");
  auto    search = std::make_shared<FakeSearch>();
  search->urls   = {"u0"};

  streamlift::util::CancellationToken cancel;
  cancel.Cancel();

  SubtitleResolver resolver(std::make_shared<FakeTranscoder>(), search, SubtitleSettings{});
  bool             threw = false;
  try {
    resolver.Resolve("m-1", "/lib/Heat.1995.mkv", MediaInfo{}, dir.Str(), cancel);
  } catch (const streamlift::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSrtToVtt();
  TestIsWebVtt();
  TestParseTitle();
  TestSelectEnglishTracks();
  TestIsZipArchive();
  TestResolverPrefersEmbedded();
  TestResolverFallsBackToSearch();
  TestResolverCapsCandidates();
  TestResolverNeverThrowsOnSearchFailure();
  TestResolverDisabled();
  TestResolverPropagatesCancellation();

  std::cout << "streamlift_unit_subtitles: pass\n";
  return 0;
}
