#include <catch2/catch.hpp>

#include "snapmerge/errors.hpp"
#include "snapmerge/media_probe.hpp"

#include "test_helpers.hpp"

using namespace snapmerge;
using namespace snapmerge::testing;

TEST_CASE("classify recognizes directories and archives by kind and name",
          "[classifier]") {
  TempDir tmp;
  fs::create_directories(tmp / "trip");
  write_text(tmp / "bundle.zip", "not really a zip");
  write_text(tmp / "Bundle.TAR.GZ", "x");

  CHECK(classify(tmp / "trip") == Kind::Directory);
  CHECK(classify(tmp / "bundle.zip") == Kind::Archive);
  CHECK(classify(tmp / "Bundle.TAR.GZ") == Kind::Archive);
}

TEST_CASE("classify probes image content rather than the extension",
          "[classifier]") {
  TempDir tmp;
  write_image(tmp / "real.png", 16, 12, "png");
  write_image(tmp / "noext", 16, 12, "jpeg");
  write_image(tmp / "lies.jpg", 16, 12, "png");

  CHECK(classify(tmp / "real.png") == Kind::Image);
  CHECK(classify(tmp / "noext") == Kind::Image);
  CHECK(classify(tmp / "lies.jpg") == Kind::Image);

  EntryProbe probe = inspect(tmp / "lies.jpg");
  REQUIRE(probe.image_format);
  CHECK(probe.image_format->name == "png");
  CHECK(image_extension(tmp / "noext") == "jpeg");
}

TEST_CASE("classify never throws for junk or missing paths", "[classifier]") {
  TempDir tmp;
  write_text(tmp / "notes.txt", "hello, this is not media\n");
  write_text(tmp / "empty.png", "");

  CHECK(classify(tmp / "notes.txt") == Kind::Unsupported);
  CHECK(classify(tmp / "empty.png") == Kind::Unsupported);
  CHECK(classify(tmp / "does-not-exist.png") == Kind::Unsupported);
}

TEST_CASE("probe_image reports dimensions and format", "[classifier]") {
  TempDir tmp;
  write_image(tmp / "a.png", 40, 30, "png");
  write_image(tmp / "b.jpg", 64, 48, "jpeg");

  auto a = probe_image(tmp / "a.png");
  REQUIRE(a);
  CHECK(a->width == 40);
  CHECK(a->height == 30);
  CHECK(a->format.extension == "png");

  auto b = probe_image(tmp / "b.jpg");
  REQUIRE(b);
  CHECK(b->format.name == "jpeg");
  CHECK(b->format.extension == "jpg");

  CHECK_FALSE(probe_video(tmp / "a.png"));
}

TEST_CASE("image_format throws for non-images", "[classifier]") {
  TempDir tmp;
  write_text(tmp / "notes.txt", "plain text");
  REQUIRE_THROWS_AS(image_format(tmp / "notes.txt"), UnsupportedMediaError);
}

TEST_CASE("extension helpers", "[classifier]") {
  auto jpeg = image_format_by_name("JPEG");
  REQUIRE(jpeg);
  CHECK(has_matching_extension("x.JPEG", *jpeg));
  CHECK(has_matching_extension("x.jpg", *jpeg));
  CHECK_FALSE(has_matching_extension("x.png", *jpeg));
  CHECK_FALSE(has_matching_extension("x", *jpeg));
  CHECK_FALSE(image_format_by_name("heic"));

  CHECK(is_known_media_extension(".png"));
  CHECK(is_known_media_extension("MP4"));
  CHECK(is_known_media_extension(".tgz"));
  CHECK_FALSE(is_known_media_extension(".2024"));
  CHECK_FALSE(is_known_media_extension(""));
}

TEST_CASE("probe_video reads size, duration and audio", "[classifier][video]") {
  TempDir tmp;
  if (!write_video(tmp / "clip.mp4", 320, 240, 1.0)) {
    WARN("ffmpeg not available, skipping");
    return;
  }

  CHECK(classify(tmp / "clip.mp4") == Kind::Video);
  auto info = probe_video(tmp / "clip.mp4");
  REQUIRE(info);
  CHECK(info->width == 320);
  CHECK(info->height == 240);
  CHECK(info->duration == Approx(1.0).margin(0.2));
  CHECK(info->has_audio);
  CHECK_FALSE(probe_image(tmp / "clip.mp4"));
}
