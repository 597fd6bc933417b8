#define BOOST_TEST_MODULE TestTempDir
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <sys/stat.h>
#include "temp_dir.hpp"

BOOST_AUTO_TEST_CASE(TestScopedTempDirLifetime)
{
    auto root = ScopedTempDir::create(fs::temp_directory_path());
    BOOST_REQUIRE(root.has_value());

    fs::path scratchPath;
    {
        auto scratch = ScopedTempDir::create(root->path());
        BOOST_REQUIRE(scratch.has_value());
        scratchPath = scratch->path();
        BOOST_CHECK_EQUAL(scratchPath.filename().string().rfind(ScopedTempDir::kPrefix, 0), 0u);

        struct stat st {};
        BOOST_REQUIRE_EQUAL(::stat(scratchPath.c_str(), &st), 0);
        BOOST_CHECK_EQUAL(st.st_mode & 0777, 0700u);

        std::ofstream(scratchPath / "archive.tar.gz") << "data";
        fs::create_directories(scratchPath / "nested");
    }
    BOOST_CHECK(!fs::exists(scratchPath));

    auto kept = ScopedTempDir::create(root->path());
    BOOST_REQUIRE(kept.has_value());
    auto keptPath = kept->release();
    BOOST_CHECK(!kept->valid());
    BOOST_CHECK(fs::is_directory(keptPath));

    auto early = ScopedTempDir::create(root->path());
    BOOST_REQUIRE(early.has_value());
    auto earlyPath = early->path();
    early->reset();
    BOOST_CHECK(!fs::exists(earlyPath));
}

BOOST_AUTO_TEST_CASE(TestSweepRemovesOnlyLeftoverWorkDirs)
{
    auto root = ScopedTempDir::create(fs::temp_directory_path());
    BOOST_REQUIRE(root.has_value());
    const auto& work = root->path();

    fs::create_directories(work / "snapvault.abc123" / "inner");
    std::ofstream(work / "snapvault.abc123" / "inner" / "blog.tar.gz") << "partial";
    fs::create_directories(work / "snapvault.XYZ789");
    fs::create_directories(work / "uploads");
    std::ofstream(work / "snapvault.notes") << "a file, not a directory";

    BOOST_CHECK_EQUAL(sweepStaleWorkDirs(work), 2u);
    BOOST_CHECK(!fs::exists(work / "snapvault.abc123"));
    BOOST_CHECK(!fs::exists(work / "snapvault.XYZ789"));
    BOOST_CHECK(fs::is_directory(work / "uploads"));
    BOOST_CHECK(fs::is_regular_file(work / "snapvault.notes"));

    BOOST_CHECK_EQUAL(sweepStaleWorkDirs(work), 0u);
    BOOST_CHECK_EQUAL(sweepStaleWorkDirs(work / "missing"), 0u);
}
