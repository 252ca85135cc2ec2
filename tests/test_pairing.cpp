#include <catch2/catch.hpp>

#include "snapmerge/errors.hpp"
#include "snapmerge/pairing.hpp"

#include "test_helpers.hpp"

using namespace snapmerge;
using namespace snapmerge::testing;

TEST_CASE("resolve_pair finds media and overlay case-insensitively",
          "[pairing]") {
  TempDir tmp;
  write_image(tmp / "X_MAIN.jpg", 32, 24, "jpeg");
  write_overlay(tmp / "x_Overlay.png", 32, 24);
  write_text(tmp / "readme.txt", "ignored");

  Pair pair = resolve_pair(tmp.path());
  CHECK(pair.media.filename() == "X_MAIN.jpg");
  CHECK(pair.overlay.filename() == "x_Overlay.png");
}

TEST_CASE("resolve_pair rejects ambiguous pairs", "[pairing]") {
  TempDir tmp;
  write_overlay(tmp / "overlay.png", 16, 16);

  SECTION("two media candidates") {
    write_image(tmp / "a_main.png", 16, 16, "png");
    write_image(tmp / "b_main.png", 16, 16, "png");
    REQUIRE_THROWS_AS(resolve_pair(tmp.path()), PairingError);
  }

  SECTION("two overlay candidates") {
    write_image(tmp / "main.png", 16, 16, "png");
    write_overlay(tmp / "overlay2.png", 16, 16);
    REQUIRE_THROWS_AS(resolve_pair(tmp.path()), PairingError);
  }
}

TEST_CASE("resolve_pair rejects missing roles", "[pairing]") {
  TempDir tmp;

  SECTION("no overlay") {
    write_image(tmp / "main.png", 16, 16, "png");
    REQUIRE_THROWS_AS(resolve_pair(tmp.path()), PairingError);
  }

  SECTION("overlay name on something that is not an image") {
    write_image(tmp / "main.png", 16, 16, "png");
    write_text(tmp / "overlay.txt", "text");
    REQUIRE_THROWS_AS(resolve_pair(tmp.path()), PairingError);
  }

  SECTION("zero-byte media is not a candidate") {
    write_text(tmp / "main.jpg", "");
    write_overlay(tmp / "overlay.png", 16, 16);
    REQUIRE_THROWS_AS(resolve_pair(tmp.path()), PairingError);
  }
}

TEST_CASE("pairing error names the directory and the count", "[pairing]") {
  TempDir tmp;
  write_image(tmp / "a_main.png", 16, 16, "png");
  write_image(tmp / "b_main.png", 16, 16, "png");
  write_overlay(tmp / "overlay.png", 16, 16);

  try {
    resolve_pair(tmp.path());
    FAIL("expected PairingError");
  } catch (const PairingError &e) {
    std::string msg = e.what();
    CHECK(msg.find(tmp.path().string()) != std::string::npos);
    CHECK(msg.find("found 2") != std::string::npos);
    CHECK(e.path() == tmp.path());
  }
}

TEST_CASE("resolve_pair requires an existing directory", "[pairing]") {
  TempDir tmp;
  write_text(tmp / "file", "x");
  REQUIRE_THROWS_AS(resolve_pair(tmp / "missing"), NotFoundError);
  REQUIRE_THROWS_AS(resolve_pair(tmp / "file"), NotFoundError);
}

TEST_CASE("name-only pairing check", "[pairing]") {
  CHECK(name_matches_role("Snap_MAIN.mp4", Role::Media));
  CHECK(name_matches_role("OVERLAY~1.png", Role::Overlay));
  CHECK_FALSE(name_matches_role("photo.png", Role::Media));

  const std::vector<std::string> good = {"x_main.jpg", "x_overlay.png"};
  const std::vector<std::string> no_media = {"x.jpg", "x_overlay.png"};
  const std::vector<std::string> two_media = {"x_main.jpg", "y_main.jpg"};

  REQUIRE_NOTHROW(check_pair_names(good, "a.zip"));
  REQUIRE_THROWS_AS(check_pair_names(no_media, "a.zip"), PairingError);
  REQUIRE_THROWS_AS(check_pair_names(two_media, "a.zip"), PairingError);
}
