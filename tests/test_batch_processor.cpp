#include <catch2/catch.hpp>

#include <chrono>
#include <map>

#include "snapmerge/batch_processor.hpp"
#include "snapmerge/config.hpp"
#include "snapmerge/errors.hpp"
#include "snapmerge/media_probe.hpp"

#include "test_helpers.hpp"

using namespace snapmerge;
using namespace snapmerge::testing;

namespace {

BatchOptions sequential() {
  BatchOptions options;
  options.num_streams = 1;
  options.fail_fast = false;
  return options;
}

/**
 * Typical export:
 *   bundle.zip  x_main.jpg (800x600) + x_overlay.png (400x300)
 *   notes.txt   unsupported
 *   photo.jpg   loose JPEG
 *   snap        JPEG without an extension
 *   trip/       trip_main.png + trip_overlay.png
 */
void make_export(const TempDir &tmp, const fs::path &input) {
  write_image(tmp / "src" / "x_main.jpg", 800, 600, "jpeg");
  write_overlay(tmp / "src" / "x_overlay.png", 400, 300);
  fs::create_directories(input);
  write_archive(input / "bundle.zip",
                {{"x_main.jpg", tmp / "src" / "x_main.jpg"},
                 {"x_overlay.png", tmp / "src" / "x_overlay.png"}});

  write_text(input / "notes.txt", "not media");
  write_image(input / "photo.jpg", 40, 30, "jpeg");
  write_image(input / "snap", 24, 16, "jpeg");
  write_image(input / "trip" / "trip_main.png", 64, 48, "png");
  write_overlay(input / "trip" / "trip_overlay.png", 64, 48);
}

std::map<std::string, const EntryResult *> by_name(const BatchReport &report) {
  std::map<std::string, const EntryResult *> out;
  for (const auto &r : report.results) {
    out[r.source.filename().string()] = &r;
  }
  return out;
}

} // anonymous namespace

TEST_CASE("entry base names", "[batch]") {
  TempDir tmp;
  write_image(tmp / "a.JPG", 8, 8, "jpeg");
  write_image(tmp / "b", 8, 8, "jpeg");
  write_image(tmp / "c.jpg", 8, 8, "png");

  CHECK(entry_base_name("x/trip.tar.gz", EntryProbe{Kind::Archive, {}}) ==
        "trip");
  CHECK(entry_base_name("x/folder.v2", EntryProbe{Kind::Directory, {}}) ==
        "folder.v2");
  CHECK(entry_base_name("x/clip.mp4", EntryProbe{Kind::Video, {}}) == "clip");
  CHECK(entry_base_name(tmp / "a.JPG", inspect(tmp / "a.JPG")) == "a");
  CHECK(entry_base_name(tmp / "b", inspect(tmp / "b")) == "b");
  CHECK(entry_base_name(tmp / "c.jpg", inspect(tmp / "c.jpg")) == "c.jpg");
}

TEST_CASE("batch routes every kind of entry", "[batch]") {
  TempDir tmp;
  make_export(tmp, tmp / "in");

  BatchProcessor processor(sequential());
  BatchReport report = processor.process(tmp / "in", tmp / "out" / "nested");
  const fs::path out = tmp / "out" / "nested";

  REQUIRE(report.results.size() == 5);
  CHECK(report.not_started == 0);
  CHECK(report.count(Outcome::Merged) == 2);
  CHECK(report.count(Outcome::Copied) == 2);
  CHECK(report.count(Outcome::Failed) == 1);
  CHECK_FALSE(report.ok());

  /// Results follow sorted entry order
  CHECK(report.results.front().source.filename() == "bundle.zip");
  CHECK(report.results.back().source.filename() == "trip");

  auto results = by_name(report);
  CHECK(results["notes.txt"]->outcome == Outcome::Failed);
  CHECK(results["notes.txt"]->error_kind == "UnsupportedEntryError");
  CHECK(results["notes.txt"]->reason.find("notes.txt") != std::string::npos);

  SECTION("archive merged at the main image's size and format") {
    CHECK(results["bundle.zip"]->output == out / "bundle.jpg");
    auto info = probe_image(out / "bundle.jpg");
    REQUIRE(info);
    CHECK(info->format.name == "jpeg");
    CHECK(info->width == 800);
    CHECK(info->height == 600);
  }

  SECTION("folder merged") {
    CHECK(results["trip"]->kind == Kind::Directory);
    CHECK(fs::is_regular_file(out / "trip.png"));
  }

  SECTION("loose image copied verbatim") {
    CHECK(results["photo.jpg"]->outcome == Outcome::Copied);
    CHECK(read_bytes(out / "photo.jpg") == read_bytes(tmp / "in" / "photo.jpg"));
  }

  SECTION("extensionless image gets its extension back") {
    CHECK(results["snap"]->output == out / "snap.jpg");
    CHECK(read_bytes(out / "snap.jpg") == read_bytes(tmp / "in" / "snap"));
  }

  SECTION("nothing else is written") {
    CHECK(count_entries(out) == 4);
    CHECK(count_entries(Config::scratch_dir()) == 0);
  }
}

TEST_CASE("second run without overwrite skips everything already written",
          "[batch]") {
  TempDir tmp;
  make_export(tmp, tmp / "in");
  const fs::path out = tmp / "out";

  BatchProcessor(sequential()).process(tmp / "in", out);

  std::map<std::string, std::vector<char>> before;
  std::map<std::string, fs::file_time_type> times;
  for (const auto &entry : fs::directory_iterator(out)) {
    before[entry.path().filename().string()] = read_bytes(entry.path());
    times[entry.path().filename().string()] = fs::last_write_time(entry.path());
  }

  BatchReport second = BatchProcessor(sequential()).process(tmp / "in", out);
  CHECK(second.count(Outcome::Skipped) == 4);
  CHECK(second.count(Outcome::Merged) == 0);
  CHECK(second.count(Outcome::Copied) == 0);
  /// The unsupported entry has no output to match and still fails
  CHECK(second.count(Outcome::Failed) == 1);

  CHECK(count_entries(out) == before.size());
  for (const auto &entry : fs::directory_iterator(out)) {
    const std::string name = entry.path().filename().string();
    CHECK(read_bytes(entry.path()) == before[name]);
    CHECK(fs::last_write_time(entry.path()) == times[name]);
  }
}

TEST_CASE("overwrite rewrites existing outputs", "[batch]") {
  TempDir tmp;
  make_export(tmp, tmp / "in");
  const fs::path out = tmp / "out";
  BatchProcessor(sequential()).process(tmp / "in", out);

  auto old_time = fs::file_time_type::clock::now() - std::chrono::hours(24);
  fs::last_write_time(out / "trip.png", old_time);
  write_text(out / "bundle.jpg", "stale");

  BatchOptions options = sequential();
  options.overwrite = true;
  BatchReport report = BatchProcessor(options).process(tmp / "in", out);

  CHECK(report.count(Outcome::Skipped) == 0);
  CHECK(report.count(Outcome::Merged) == 2);
  CHECK(fs::last_write_time(out / "trip.png") != old_time);
  CHECK(probe_image(out / "bundle.jpg"));
}

TEST_CASE("existing output with another extension or case is skipped",
          "[batch]") {
  TempDir tmp;
  make_export(tmp, tmp / "in");
  const fs::path out = tmp / "out";
  write_text(out / "TRIP.mp4", "previous result");

  auto results =
      BatchProcessor(sequential()).process(tmp / "in", out).results;
  for (const auto &r : results) {
    if (r.source.filename() == "trip")
      CHECK(r.outcome == Outcome::Skipped);
  }
  CHECK_FALSE(fs::exists(out / "trip.png"));
}

TEST_CASE("a failing entry does not stop the others", "[batch]") {
  TempDir tmp;
  const fs::path in = tmp / "in";
  write_image(in / "a_pair" / "one_main.png", 16, 16, "png");
  write_image(in / "a_pair" / "two_main.png", 16, 16, "png");
  write_overlay(in / "a_pair" / "overlay.png", 16, 16);
  write_image(in / "b_pair" / "main.png", 16, 16, "png");
  write_overlay(in / "b_pair" / "overlay.png", 16, 16);
  write_image(tmp / "src" / "a.png", 8, 8, "png");
  write_archive(in / "c_bad.zip", {{"only_main.png", tmp / "src" / "a.png"}});

  BatchReport report =
      BatchProcessor(sequential()).process(in, tmp / "out");
  auto results = by_name(report);

  CHECK(results["a_pair"]->error_kind == "PairingError");
  CHECK(results["b_pair"]->outcome == Outcome::Merged);
  CHECK(results["c_bad.zip"]->error_kind == "InvalidArchiveError");
  CHECK(fs::exists(tmp / "out" / "b_pair.png"));
  CHECK(count_entries(Config::scratch_dir()) == 0);
}

TEST_CASE("fail-fast stops starting entries after the first failure",
          "[batch]") {
  TempDir tmp;
  const fs::path in = tmp / "in";
  write_text(in / "a_notes.txt", "junk");
  write_image(in / "b.png", 8, 8, "png");
  write_image(in / "c.png", 8, 8, "png");

  BatchOptions options = sequential();
  options.fail_fast = true;
  BatchReport report = BatchProcessor(options).process(in, tmp / "out");

  REQUIRE(report.results.size() == 1);
  CHECK(report.results[0].outcome == Outcome::Failed);
  CHECK(report.not_started == 2);
  CHECK_FALSE(report.ok());
  CHECK(count_entries(tmp / "out") == 0);
}

TEST_CASE("entries claiming the same output name conflict", "[batch]") {
  TempDir tmp;
  const fs::path in = tmp / "in";
  write_image(in / "trip" / "main.png", 16, 16, "png");
  write_overlay(in / "trip" / "overlay.png", 16, 16);
  write_image(tmp / "src" / "main.png", 16, 16, "png");
  write_overlay(tmp / "src" / "overlay.png", 16, 16);
  write_archive(in / "trip.zip", {{"main.png", tmp / "src" / "main.png"},
                                  {"overlay.png", tmp / "src" / "overlay.png"}});

  BatchReport report = BatchProcessor(sequential()).process(in, tmp / "out");
  auto results = by_name(report);

  CHECK(results["trip"]->outcome == Outcome::Merged);
  CHECK(results["trip.zip"]->outcome == Outcome::Failed);
  CHECK(results["trip.zip"]->error_kind == "OutputConflictError");
  CHECK(count_entries(tmp / "out") == 1);
}

TEST_CASE("entries sharing a stem but not an output file are all written",
          "[batch]") {
  TempDir tmp;
  const fs::path in = tmp / "in";
  write_image(in / "photo.jpg", 16, 16, "jpeg");
  write_image(in / "photo.png", 16, 16, "png");
  write_image(in / "clip" / "clip_main.png", 16, 16, "png");
  write_overlay(in / "clip" / "clip_overlay.png", 16, 16);
  write_image(in / "clip.jpg", 16, 16, "jpeg");

  BatchReport report = BatchProcessor(sequential()).process(in, tmp / "out");
  auto results = by_name(report);

  CHECK(report.ok());
  CHECK(results["photo.jpg"]->outcome == Outcome::Copied);
  CHECK(results["photo.png"]->outcome == Outcome::Copied);
  CHECK(results["clip"]->outcome == Outcome::Merged);
  CHECK(results["clip"]->output == tmp / "out" / "clip.png");
  CHECK(results["clip.jpg"]->outcome == Outcome::Copied);
  CHECK(count_entries(tmp / "out") == 4);
}

TEST_CASE("a video and a photo with the same stem are both copied",
          "[batch][video]") {
  TempDir tmp;
  const fs::path in = tmp / "in";
  if (!write_video(in / "photo.mp4", 64, 48, 0.5)) {
    WARN("ffmpeg not available, skipping");
    return;
  }
  write_image(in / "photo.jpg", 16, 16, "jpeg");

  BatchReport report = BatchProcessor(sequential()).process(in, tmp / "out");
  auto results = by_name(report);

  CHECK(results["photo.jpg"]->outcome == Outcome::Copied);
  CHECK(results["photo.mp4"]->outcome == Outcome::Copied);
  CHECK(fs::exists(tmp / "out" / "photo.jpg"));
  CHECK(fs::exists(tmp / "out" / "photo.mp4"));
}

TEST_CASE("a merged folder and a loose copy writing the same file conflict",
          "[batch]") {
  TempDir tmp;
  const fs::path in = tmp / "in";
  write_image(in / "photo" / "photo_main.png", 16, 16, "png");
  write_overlay(in / "photo" / "photo_overlay.png", 16, 16);
  write_image(in / "photo.png", 16, 16, "png");

  BatchReport report = BatchProcessor(sequential()).process(in, tmp / "out");
  auto results = by_name(report);

  CHECK(results["photo"]->outcome == Outcome::Merged);
  CHECK(results["photo.png"]->outcome == Outcome::Failed);
  CHECK(results["photo.png"]->error_kind == "OutputConflictError");
  CHECK(count_entries(tmp / "out") == 1);
}

TEST_CASE("two archives unpacking to the same file conflict", "[batch]") {
  TempDir tmp;
  const fs::path in = tmp / "in";
  write_image(tmp / "src" / "main.png", 16, 16, "png");
  write_overlay(tmp / "src" / "overlay.png", 16, 16);
  const std::vector<std::pair<std::string, fs::path>> members = {
      {"main.png", tmp / "src" / "main.png"},
      {"overlay.png", tmp / "src" / "overlay.png"}};
  fs::create_directories(in);
  write_archive(in / "trip.tar", members);
  write_archive(in / "trip.zip", members);

  BatchReport report = BatchProcessor(sequential()).process(in, tmp / "out");
  auto results = by_name(report);

  CHECK(results["trip.tar"]->outcome == Outcome::Merged);
  CHECK(results["trip.zip"]->error_kind == "OutputConflictError");
  CHECK(count_entries(tmp / "out") == 1);
}

TEST_CASE("dry run validates but writes nothing", "[batch]") {
  TempDir tmp;
  make_export(tmp, tmp / "in");
  write_image(tmp / "src" / "a.png", 8, 8, "png");
  write_archive(tmp / "in" / "odd.zip",
                {{"one.png", tmp / "src" / "a.png"},
                 {"two.png", tmp / "src" / "a.png"}});

  BatchOptions options = sequential();
  options.dry_run = true;
  BatchReport report = BatchProcessor(options).process(tmp / "in", tmp / "out");
  auto results = by_name(report);

  CHECK_FALSE(fs::exists(tmp / "out"));
  CHECK(count_entries(Config::scratch_dir()) == 0);

  CHECK(results["bundle.zip"]->outcome == Outcome::Merged);
  CHECK(results["trip"]->output == tmp / "out" / "trip.png");
  CHECK(results["snap"]->output == tmp / "out" / "snap.jpg");
  CHECK(results["photo.jpg"]->outcome == Outcome::Copied);
  CHECK(results["odd.zip"]->error_kind == "PairingError");
  CHECK(results["notes.txt"]->error_kind == "UnsupportedEntryError");
}

TEST_CASE("parallel streams give the same results", "[batch]") {
  TempDir tmp;
  make_export(tmp, tmp / "in");

  BatchOptions options = sequential();
  options.num_streams = 4;
  BatchReport report = BatchProcessor(options).process(tmp / "in", tmp / "out");

  CHECK(report.results.size() == 5);
  CHECK(report.count(Outcome::Merged) == 2);
  CHECK(report.count(Outcome::Copied) == 2);
  CHECK(report.count(Outcome::Failed) == 1);
  CHECK(report.results.front().source.filename() == "bundle.zip");
  CHECK(count_entries(tmp / "out") == 4);
}

TEST_CASE("missing input directory", "[batch]") {
  TempDir tmp;
  REQUIRE_THROWS_AS(
      BatchProcessor(sequential()).process(tmp / "nope", tmp / "out"),
      NotFoundError);
  CHECK_FALSE(fs::exists(tmp / "out"));
}

TEST_CASE("folder with a video becomes an MP4", "[batch][video]") {
  TempDir tmp;
  const fs::path in = tmp / "in";
  if (!write_video(in / "clip" / "clip_main.mp4", 640, 480, 2.0)) {
    WARN("ffmpeg not available, skipping");
    return;
  }
  write_overlay(in / "clip" / "clip_overlay.png", 640, 480);
  write_video(in / "loose.mp4", 160, 120, 1.0);

  BatchReport report = BatchProcessor(sequential()).process(in, tmp / "out");
  auto results = by_name(report);

  CHECK(results["clip"]->output == tmp / "out" / "clip.mp4");
  auto info = probe_video(tmp / "out" / "clip.mp4");
  REQUIRE(info);
  CHECK(info->width == 640);
  CHECK(info->height == 480);
  CHECK(info->duration == Approx(2.0).margin(0.3));
  CHECK(info->has_audio);

  CHECK(results["loose.mp4"]->outcome == Outcome::Copied);
  CHECK(read_bytes(tmp / "out" / "loose.mp4") == read_bytes(in / "loose.mp4"));
}
