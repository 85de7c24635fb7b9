#include "SecureCommitter.hpp"

#include "test_support.hpp"

#include <cassert>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace {

std::filesystem::path stage(const std::filesystem::path& dir, const std::string& content) {
    auto [ok, file, err] = FileStream::CreateTemp(dir, "staging_");
    assert(ok);
    assert(!file->Write(content));
    assert(!file->Close());
    return file->GetPath();
}

} // namespace

int main() {
    // Backup names use local time
    ::setenv("TZ", "UTC", 1);
    ::tzset();

    assert(SecureCommitter::ResolveName("a/b/c.bin", "") == "c.bin");
    assert(SecureCommitter::ResolveName("c.bin", "") == "c.bin");
    assert(SecureCommitter::ResolveName("a/b/", "") == "b");
    assert(SecureCommitter::ResolveName("a/b/c.bin", "local.bin") == "local.bin");
    assert(SecureCommitter::ResolveName("a/b/c.bin", "../escape") == "../escape");
    assert(SecureCommitter::ResolveName("/", "") == "/");

    {
        const struct timespec mtime{1704164645, 123456789};  // 2024-01-02 03:04:05.123456789 UTC
        assert(SecureCommitter::MakeBackupName("report.txt", mtime) == "report.20240102030405.123456.txt");
        assert(SecureCommitter::MakeBackupName("README", mtime) == "README.20240102030405.123456");
        assert(SecureCommitter::MakeBackupName("archive.tar.gz", mtime) == "archive.tar.20240102030405.123456.gz");
        assert(SecureCommitter::MakeBackupName(".bashrc", mtime) == ".20240102030405.123456.bashrc");
        assert(SecureCommitter::MakeBackupName("trailing.", mtime) == "trailing.20240102030405.123456.");

        const struct timespec whole{1704164645, 999};
        assert(SecureCommitter::MakeBackupName("a.bin", whole) == "a.20240102030405.000000.bin");
    }

    test_support::TempDir staging_dir("fdo_staging_");
    test_support::TempDir dest;
    SecureCommitter committer(dest.path(), nullptr);

    // Same volume: a plain rename
    {
        const auto staged = stage(staging_dir.path(), "renamed content");
        auto [ok, result, err] = committer.Commit(staged, "renamed.bin");
        assert(ok);
        assert(!result.copied);
        assert(!result.backup);
        assert(result.size == 15);
        assert(result.path == dest.path() / "renamed.bin");
        assert(test_support::read_file(result.path) == "renamed content");
        assert(!std::filesystem::exists(staged));
    }

    // Copy: content arrives, no temporary file or staging left over
    {
        const auto staged = stage(staging_dir.path(), "copied content");
        auto [ok, result, err] = committer.Commit(staged, "./copied.bin", SecureCommitter::Mode::Copy);
        assert(ok);
        assert(result.copied);
        assert(result.path == dest.path() / "copied.bin");
        assert(test_support::read_file(result.path) == "copied content");
        assert(!std::filesystem::exists(staged));
        assert((test_support::list_dir(dest.path()) == std::vector<std::string>{"copied.bin", "renamed.bin"}));
    }

    // An existing file is kept under its modification time
    {
        test_support::write_file(dest.path() / "report.txt", "old report");
        test_support::set_mtime(dest.path() / "report.txt", 1704164645, 123456789);

        const auto staged = stage(staging_dir.path(), "new report");
        auto [ok, result, err] = committer.Commit(staged, "report.txt");
        assert(ok);
        assert(result.backup);
        assert(*result.backup == dest.path() / "report.20240102030405.123456.txt");
        assert(test_support::read_file(*result.backup) == "old report");
        assert(test_support::read_file(dest.path() / "report.txt") == "new report");
    }

    // Same for names without extension, through the copy branch
    {
        test_support::write_file(dest.path() / "README", "old readme");
        test_support::set_mtime(dest.path() / "README", 1704164645, 5000);

        const auto staged = stage(staging_dir.path(), "new readme");
        auto [ok, result, err] = committer.Commit(staged, "README", SecureCommitter::Mode::Copy);
        assert(ok);
        assert(test_support::read_file(dest.path() / "README.20240102030405.000005") == "old readme");
        assert(test_support::read_file(dest.path() / "README") == "new readme");
    }

    // A backup name that is already taken is never overwritten
    {
        test_support::write_file(dest.path() / "clash.txt", "current");
        test_support::write_file(dest.path() / "clash.20240102030405.000000.txt", "earlier backup");
        test_support::set_mtime(dest.path() / "clash.txt", 1704164645, 0);

        const auto staged = stage(staging_dir.path(), "incoming");
        auto [ok, result, err] = committer.Commit(staged, "clash.txt");
        assert(!ok);
        assert(err.kind == ServiceInfoError::Kind::IO);
        assert(test_support::read_file(dest.path() / "clash.txt") == "current");
        assert(test_support::read_file(dest.path() / "clash.20240102030405.000000.txt") == "earlier backup");
        assert(!std::filesystem::exists(staged));

        std::filesystem::remove(dest.path() / "clash.txt");
        std::filesystem::remove(dest.path() / "clash.20240102030405.000000.txt");
    }

    const auto before = test_support::list_dir(dest.path());

    // Names that leave the destination are refused before anything moves
    for (const std::string name : {"../../../../../../../../tmp/escaped.txt",
                                   "foo/../../../../../../../tmp/escaped.txt",
                                   "/tmp/escaped.txt",
                                   "..",
                                   "."}) {
        const auto staged = stage(staging_dir.path(), "hostile");
        auto [ok, result, err] = committer.Commit(staged, name);
        assert(!ok);
        assert(err.kind == ServiceInfoError::Kind::Security);
        assert(!std::filesystem::exists(staged));
        assert(test_support::list_dir(dest.path()) == before);
    }

    // So are symlinks pointing out of it
    {
        test_support::TempDir outside("fdo_outside_");
        std::filesystem::create_directory_symlink(outside.path(), dest.path() / "out");

        for (auto mode : {SecureCommitter::Mode::Rename, SecureCommitter::Mode::Copy}) {
            const auto staged = stage(staging_dir.path(), "hostile");
            auto [ok, result, err] = committer.Commit(staged, "out/escaped.txt", mode);
            assert(!ok);
            assert(err.kind == ServiceInfoError::Kind::Security);
            assert(!std::filesystem::exists(staged));
            assert(test_support::list_dir(outside.path()).empty());
        }

        std::filesystem::remove(dest.path() / "out");
    }

    // and symlinks that stay inside, whichever way the path is resolved
    {
        std::filesystem::create_directory(dest.path() / "real");
        std::filesystem::create_directory_symlink("real", dest.path() / "alias");

        for (bool walk : {false, true}) {
            SecureRoot::ForceComponentWalk(walk);

            const auto staged = stage(staging_dir.path(), "via alias");
            auto [ok, result, err] = committer.Commit(staged, "alias/aliased.txt");
            assert(!ok);
            assert(err.kind == ServiceInfoError::Kind::Security);
            assert(!std::filesystem::exists(staged));
            assert(test_support::list_dir(dest.path() / "real").empty());
        }
        SecureRoot::ForceComponentWalk(false);

        std::filesystem::remove(dest.path() / "alias");
        std::filesystem::remove(dest.path() / "real");
    }

    // Subdirectories are used but never created
    {
        const auto staged = stage(staging_dir.path(), "nested");
        auto [ok, result, err] = committer.Commit(staged, "subdir/nested.txt");
        assert(!ok);
        assert(err.kind == ServiceInfoError::Kind::IO);
        assert(!std::filesystem::exists(dest.path() / "subdir"));
        assert(!std::filesystem::exists(staged));

        std::filesystem::create_directory(dest.path() / "subdir");
        const auto again = stage(staging_dir.path(), "nested");
        auto [ok2, result2, err2] = committer.Commit(again, "subdir/nested.txt");
        assert(ok2);
        assert(result2.path == dest.path() / "subdir" / "nested.txt");
        assert(test_support::read_file(dest.path() / "subdir" / "nested.txt") == "nested");
    }

    // Forcing a rename across volumes fails instead of falling back
    {
        struct stat shm;
        struct stat tmp;
        if (::stat("/dev/shm", &shm) == 0 && ::stat(dest.path().c_str(), &tmp) == 0 && shm.st_dev != tmp.st_dev
            && ::access("/dev/shm", W_OK) == 0) {
            const auto staged = stage("/dev/shm", "other volume");

            auto [rename_ok, rename_result, rename_err] = committer.Commit(staged, "forced.bin", SecureCommitter::Mode::Rename);
            assert(!rename_ok);
            assert(rename_err.kind == ServiceInfoError::Kind::IO);
            assert(!std::filesystem::exists(dest.path() / "forced.bin"));
            assert(!std::filesystem::exists(staged));

            const auto again = stage("/dev/shm", "other volume");
            auto [ok, result, err] = committer.Commit(again, "crossed.bin");
            assert(ok);
            assert(result.copied);
            assert(test_support::read_file(dest.path() / "crossed.bin") == "other volume");
            assert(!std::filesystem::exists(again));
        } else {
            std::cerr << "no second volume available, skipping cross-volume checks" << std::endl;
        }
    }

    assert(test_support::list_dir(staging_dir.path()).empty());

    return 0;
}
