/**
 * @file test_workspace.cpp
 * @brief Unit tests for scratch directory and install handling
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <chrono>
#include <string>

#include "fixture.hpp"
#include "fwpipe/internal/workspace.hpp"

using namespace fwpipe::internal;
using namespace fwpipe_test;

/* ========================================================================= */
/* Path Joining                                                              */
/* ========================================================================= */

TEST_CASE("Workspace: join_path")
{
  CHECK(join_path(".", "test.o") == "test.o");
  CHECK(join_path("", "test.o") == "test.o");
  CHECK(join_path("out", "test.o") == "out/test.o");
  CHECK(join_path("/abs/dir", "test.o") == "/abs/dir/test.o");
}

/* ========================================================================= */
/* Scratch Directory                                                         */
/* ========================================================================= */

TEST_CASE("Workspace: scratch directory lifetime")
{
  TempTree tree;

  SUBCASE("Create and remove")
  {
    ScratchDir scratch;
    CHECK_FALSE(scratch.valid());

    REQUIRE(scratch.create(tree.work, ".fwpipe-"));
    CHECK(scratch.valid());
    CHECK(fs::is_directory(scratch.path()));
    CHECK(scratch.path().parent_path() == tree.work);
    CHECK(scratch.path().filename().string().rfind(".fwpipe-", 0) == 0);

    write_file(scratch.path() / "test.o", "object");

    const fs::path created = scratch.path();
    scratch.remove();
    CHECK_FALSE(scratch.valid());
    CHECK_FALSE(fs::exists(created));
  }

  SUBCASE("Destructor removes the tree")
  {
    fs::path created;
    {
      ScratchDir scratch;
      REQUIRE(scratch.create(tree.work, ".fwpipe-"));
      created = scratch.path();
      fs::create_directories(created / "nested");
      write_file(created / "nested" / "file", "data");
    }
    CHECK_FALSE(fs::exists(created));
  }

  SUBCASE("Two scratch directories never collide")
  {
    ScratchDir a;
    ScratchDir b;
    REQUIRE(a.create(tree.work, ".fwpipe-"));
    REQUIRE(b.create(tree.work, ".fwpipe-"));
    CHECK(a.path() != b.path());
    CHECK(count_scratch_dirs(tree.work) == 2);
  }

  SUBCASE("Recreate replaces the previous directory")
  {
    ScratchDir scratch;
    REQUIRE(scratch.create(tree.work, ".fwpipe-"));
    const fs::path first = scratch.path();
    REQUIRE(scratch.create(tree.work, ".fwpipe-"));
    CHECK_FALSE(fs::exists(first));
    CHECK(count_scratch_dirs(tree.work) == 1);
  }

  SUBCASE("Missing parent")
  {
    ScratchDir scratch;
    CHECK_FALSE(scratch.create(tree.root / "no-such-dir", ".fwpipe-"));
    CHECK_FALSE(scratch.valid());
  }

  CHECK(count_scratch_dirs(tree.work) == 0);
}

TEST_CASE("Workspace: publish")
{
  TempTree tree;
  ScratchDir scratch;
  REQUIRE(scratch.create(tree.work, ".fwpipe-"));

  SUBCASE("Moves file to destination")
  {
    write_file(scratch.path() / "test.bin", "blob");
    REQUIRE(scratch.publish("test.bin", tree.work));
    CHECK(read_file(tree.work / "test.bin") == "blob");
    CHECK_FALSE(fs::exists(scratch.path() / "test.bin"));
  }

  SUBCASE("Replaces existing file")
  {
    write_file(tree.work / "test.bin", "old");
    write_file(scratch.path() / "test.bin", "new");
    REQUIRE(scratch.publish("test.bin", tree.work));
    CHECK(read_file(tree.work / "test.bin") == "new");
  }

  SUBCASE("Missing file")
  {
    CHECK_FALSE(scratch.publish("test.bin", tree.work));
  }
}

/* ========================================================================= */
/* Publish Lock                                                              */
/* ========================================================================= */

TEST_CASE("Workspace: publish lock")
{
  TempTree tree;

  SUBCASE("Acquire, release, reacquire")
  {
    PublishLock lock;
    CHECK_FALSE(lock.held());
    REQUIRE(lock.acquire(tree.work));
    CHECK(lock.held());
    CHECK(fs::exists(tree.work / ".fwpipe.lock"));

    lock.release();
    CHECK_FALSE(lock.held());

    // A second owner in the same process gets it once the first lets go
    PublishLock other;
    CHECK(other.acquire(tree.work));
  }

  SUBCASE("Destructor releases")
  {
    {
      PublishLock lock;
      REQUIRE(lock.acquire(tree.work));
    }
    PublishLock other;
    CHECK(other.acquire(tree.work));
  }

  SUBCASE("Missing directory")
  {
    PublishLock lock;
    CHECK_FALSE(lock.acquire(tree.root / "no-such-dir"));
    CHECK_FALSE(lock.held());
  }
}

/* ========================================================================= */
/* Install                                                                   */
/* ========================================================================= */

TEST_CASE("Workspace: install_file")
{
  TempTree tree;
  const fs::path blob = tree.work / "test.bin";
  write_file(blob, std::string("\x00\x10\x02\x20", 4));

  SUBCASE("Copies content, mode and mtime")
  {
    fs::permissions(blob, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read,
                    fs::perm_options::replace);
    const fs::file_time_type mtime = fs::file_time_type::clock::now() - std::chrono::hours(24);
    fs::last_write_time(blob, mtime);

    REQUIRE(install_file(blob, tree.appbins));

    const fs::path dest = tree.appbins / "test.bin";
    CHECK(read_file(dest) == read_file(blob));
    CHECK(fs::status(dest).permissions() == fs::status(blob).permissions());
    CHECK(fs::last_write_time(dest) == fs::last_write_time(blob));
  }

  SUBCASE("Overwrites previous install")
  {
    write_file(tree.appbins / "test.bin", "stale");
    REQUIRE(install_file(blob, tree.appbins));
    CHECK(read_file(tree.appbins / "test.bin") == read_file(blob));
  }

  SUBCASE("Missing destination directory")
  {
    const fs::path missing = tree.root / "firmware" / "kernel" / "missing";
    CHECK_FALSE(install_file(blob, missing));
    CHECK_FALSE(fs::exists(missing));
  }

  SUBCASE("Two installs in one process")
  {
    const fs::path other = tree.root / "test.bin";
    write_file(other, "other");
    REQUIRE(install_file(other, tree.appbins));
    REQUIRE(install_file(blob, tree.appbins));
    CHECK(read_file(tree.appbins / "test.bin") == read_file(blob));
  }

  SUBCASE("Missing source")
  {
    CHECK_FALSE(install_file(tree.work / "absent.bin", tree.appbins));
    CHECK_FALSE(fs::exists(tree.appbins / "absent.bin"));
  }

  // No temporary copies left behind
  size_t entries = 0;
  for (const auto& entry : fs::directory_iterator(tree.appbins))
  {
    if (entry.path().filename().string()[0] == '.')
    {
      ++entries;
    }
  }
  CHECK(entries == 0);
}
