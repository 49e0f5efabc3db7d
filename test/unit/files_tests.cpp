// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"

#include <filesystem>
#include <sys/stat.h>

using namespace ziacoin::util;
using ziacoin::test::TempDir;

TEST_CASE("File utilities", "[files]") {
    TempDir tmp("ziacoin_files");
    const auto test_dir = tmp.path();

    SECTION("ensure_directory creates nested directories") {
        auto subdir = test_dir / "sub" / "nested";
        REQUIRE(ensure_directory(subdir));
        REQUIRE(std::filesystem::is_directory(subdir));
        // Already there
        REQUIRE(ensure_directory(subdir));
    }

    SECTION("atomic_write_file then read_file_string") {
        auto file_path = test_dir / "data.json";
        REQUIRE(atomic_write_file(file_path, "{\"a\":1}"));
        REQUIRE(read_file_string(file_path) == "{\"a\":1}");
    }

    SECTION("atomic_write_file replaces content and leaves no temp files") {
        auto file_path = test_dir / "data.json";
        REQUIRE(atomic_write_file(file_path, "old content that is longer"));
        REQUIRE(atomic_write_file(file_path, "new"));
        REQUIRE(read_file_string(file_path) == "new");

        size_t entries = 0;
        for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
            (void)entry;
            ++entries;
        }
        REQUIRE(entries == 1);
    }

    SECTION("atomic_write_file applies the requested mode") {
        auto file_path = test_dir / "key.pem";
        REQUIRE(atomic_write_file(file_path, "secret", 0600));
        struct stat st {};
        REQUIRE(stat(file_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);
    }

    SECTION("atomic_write_file fails when the directory is missing") {
        REQUIRE_FALSE(atomic_write_file(test_dir / "missing" / "x.json", "x"));
    }

    SECTION("read_file_string of a missing file is empty") {
        REQUIRE(read_file_string(test_dir / "nope").empty());
    }

    SECTION("copy_directory copies a tree and replaces the target") {
        auto from = test_dir / "from";
        REQUIRE(ensure_directory(from / "blocks"));
        REQUIRE(atomic_write_file(from / "meta.json", "m"));
        REQUIRE(atomic_write_file(from / "blocks" / "b.json", "b"));

        auto to = test_dir / "to";
        REQUIRE(ensure_directory(to));
        REQUIRE(atomic_write_file(to / "stale.json", "s"));

        REQUIRE(copy_directory(from, to));
        REQUIRE(read_file_string(to / "meta.json") == "m");
        REQUIRE(read_file_string(to / "blocks" / "b.json") == "b");
        REQUIRE_FALSE(std::filesystem::exists(to / "stale.json"));
    }

    SECTION("copy_directory of a missing source fails") {
        REQUIRE_FALSE(copy_directory(test_dir / "nothing", test_dir / "out"));
    }

    SECTION("default datadir ends in .ziacoin") {
        REQUIRE(get_default_datadir().filename() == ".ziacoin");
    }
}

TEST_CASE("Directory lock", "[files][lock]") {
    TempDir tmp("ziacoin_lock");

    DirectoryLock first(tmp.path());
    REQUIRE(first.Acquire() == DirectoryLock::Result::Success);
    REQUIRE(first.IsHeld());
    // Re-acquiring our own lock is a no-op
    REQUIRE(first.Acquire() == DirectoryLock::Result::Success);

    SECTION("A second holder is refused") {
        DirectoryLock second(tmp.path());
        REQUIRE(second.Acquire() == DirectoryLock::Result::ErrorLock);
        REQUIRE_FALSE(second.IsHeld());
        REQUIRE_FALSE(second.GetReason().empty());
    }

    SECTION("Released lock can be taken again") {
        first.Release();
        REQUIRE_FALSE(first.IsHeld());
        DirectoryLock second(tmp.path());
        REQUIRE(second.Acquire() == DirectoryLock::Result::Success);
    }

    SECTION("Missing directory cannot be locked") {
        DirectoryLock other(tmp.path() / "missing");
        REQUIRE(other.Acquire() == DirectoryLock::Result::ErrorWrite);
    }
}
