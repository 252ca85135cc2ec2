#include <catch2/catch.hpp>

#include "snapmerge/output_index.hpp"

#include "test_helpers.hpp"

using namespace snapmerge;
using namespace snapmerge::testing;

TEST_CASE("existence check ignores case and extension", "[output_index]") {
  TempDir tmp;
  write_text(tmp / "photo.PNG", "x");
  write_text(tmp / "Trip.mp4", "x");
  fs::create_directories(tmp / "folder");

  CHECK(exists_in("photo", tmp.path()));
  CHECK(exists_in("PHOTO", tmp.path()));
  CHECK(exists_in("trip", tmp.path()));
  CHECK(exists_in("folder", tmp.path()));
  CHECK_FALSE(exists_in("photo.png", tmp.path()));
  CHECK_FALSE(exists_in("other", tmp.path()));
}

TEST_CASE("existence check on a missing destination", "[output_index]") {
  TempDir tmp;
  CHECK_FALSE(exists_in("anything", tmp / "not-created"));
  CHECK(OutputIndex::snapshot(tmp / "not-created").size() == 0);
}

TEST_CASE("snapshot does not see files written after it was taken",
          "[output_index]") {
  TempDir tmp;
  write_text(tmp / "a.jpg", "x");

  OutputIndex index = OutputIndex::snapshot(tmp.path());
  write_text(tmp / "b.jpg", "x");

  CHECK(index.size() == 1);
  CHECK(index.contains("A"));
  CHECK_FALSE(index.contains("b"));
  CHECK(exists_in("b", tmp.path()));
}
