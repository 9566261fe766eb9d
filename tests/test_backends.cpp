#include "TestHarness.hpp"
#include "ConfigGlobal.hpp"
#include "CloudBackend.hpp"
#include "FileHasher.hpp"
#include "FilesystemBackend.hpp"
#include "RsyncBackend.hpp"
#include "TransportErrors.hpp"

#include <memory>

namespace FS = std::filesystem;

// Reports rsync as missing so the plain copy path runs.
static std::shared_ptr<FakeCommandRunner> NoRsync()
{
    return std::make_shared<FakeCommandRunner>([](const std::string&) { return CommandResult{ 1, "" }; });
}

static CopyPlan MakePlan(const std::string& Source, const std::string& Destination)
{
    CopyPlan Plan;
    Plan.Source = Source;
    Plan.Destination = Destination;
    return Plan;
}

TEST(hash_is_stable_and_content_sensitive)
{
    TempDir Dir;
    FS::path A = Dir.Write("a.bin", "same bytes");
    FS::path B = Dir.Write("b.bin", "same bytes");
    FS::path C = Dir.Write("c.bin", "other bytes");

    std::string DigestA = FileHasher::HashFile(A.string());
    ASSERT_EQ(DigestA.size(), 64u);
    ASSERT_EQ(DigestA, FileHasher::HashFile(B.string()));
    ASSERT(DigestA != FileHasher::HashFile(C.string()));
    ASSERT_THROWS(FileHasher::HashFile(Dir.Path("missing").string()), std::runtime_error);
}

TEST(filesystem_probes)
{
    TempDir Dir;
    FilesystemBackend Backend(NoRsync());
    FS::create_directories(Dir.Path("root/b"));
    FS::create_directories(Dir.Path("root/a"));
    Dir.Write("root/file.txt", "x");

    ASSERT(Backend.Connect());
    ASSERT(Backend.Exists(Dir.Path("root").string()));
    ASSERT(!Backend.Exists(Dir.Path("root/nothing").string()));

    std::vector<std::string> Dirs = Backend.ListDirs(Dir.Path("root").string());
    ASSERT_EQ(Dirs.size(), 2u);
    ASSERT_EQ(Dirs[0], "a");
    ASSERT_EQ(Dirs[1], "b");
    ASSERT(Backend.ListDirs(Dir.Path("root/nothing").string()).empty());
}

TEST(filesystem_list_dirs_never_raises)
{
    TempDir Dir;
    FilesystemBackend Backend(NoRsync());
    FS::create_directories(Dir.Path("root/real"));
    FS::create_symlink(Dir.Path("root/gone"), Dir.Path("root/dangling"));
    Dir.Write("root/file.txt", "x");

    std::vector<std::string> Dirs = Backend.ListDirs(Dir.Path("root").string());
    ASSERT_EQ(Dirs.size(), 1u);
    ASSERT_EQ(Dirs[0], "real");
    ASSERT(Backend.ListDirs(Dir.Path("root/file.txt").string()).empty());
}

TEST(filesystem_free_space_walks_up_to_existing_ancestor)
{
    TempDir Dir;
    FilesystemBackend Backend(NoRsync());

    int64_t Existing = Backend.GetFreeSpace(Dir.Path().string());
    int64_t NotYetCreated = Backend.GetFreeSpace(Dir.Path("not/yet/created").string());
    ASSERT(Existing > 0);
    ASSERT(NotYetCreated > 0);
    ASSERT(!FS::exists(Dir.Path("not")));
}

TEST(filesystem_mkdir_is_idempotent)
{
    TempDir Dir;
    FilesystemBackend Backend(NoRsync());
    std::string Target = Dir.Path("x/y/z").string();

    Backend.MakeDir(Target);
    Backend.MakeDir(Target);
    ASSERT(FS::is_directory(Target));
}

TEST(filesystem_copies_directory_under_its_name)
{
    TempDir Dir;
    Dir.Write("src/a/one.txt", "one");
    Dir.Write("src/a/sub/two.txt", "two");
    FilesystemBackend Backend(NoRsync());

    Backend.Transfer(MakePlan(Dir.Path("src/a").string(), Dir.Path("dst").string()), true, true);

    ASSERT_EQ(ReadFile(Dir.Path("dst/a/one.txt")), "one");
    ASSERT_EQ(ReadFile(Dir.Path("dst/a/sub/two.txt")), "two");
}

TEST(filesystem_copies_single_file_into_destination)
{
    TempDir Dir;
    Dir.Write("src/report.log", "payload");
    FilesystemBackend Backend(NoRsync());

    Backend.Transfer(MakePlan(Dir.Path("src/report.log").string(), Dir.Path("dst").string()), false, true);

    ASSERT_EQ(ReadFile(Dir.Path("dst/report.log")), "payload");
}

TEST(filesystem_repeated_copy_matches_source)
{
    TempDir Dir;
    Dir.Write("src/a/one.txt", "final content");
    Dir.Write("dst/a/one.txt", "final");
    FilesystemBackend Backend(NoRsync());
    CopyPlan Plan = MakePlan(Dir.Path("src/a").string(), Dir.Path("dst").string());

    Backend.Transfer(Plan, true, false);
    Backend.Transfer(Plan, true, true);

    ASSERT_EQ(ReadFile(Dir.Path("dst/a/one.txt")), "final content");
}

TEST(filesystem_missing_source_raises)
{
    TempDir Dir;
    FilesystemBackend Backend(NoRsync());
    ASSERT_THROWS(Backend.Transfer(MakePlan(Dir.Path("gone").string(), Dir.Path("dst").string()), false, false), TransferError);
}

TEST(filesystem_resume_delegates_to_rsync)
{
    TempDir Dir;
    Dir.Write("src/a/one.txt", "one");
    auto Runner = std::make_shared<FakeCommandRunner>();
    FilesystemBackend Backend(Runner);

    Backend.Transfer(MakePlan(Dir.Path("src/a").string(), Dir.Path("dst").string()), true, false);

    ASSERT_EQ(Runner->Commands.size(), 2u);
    ASSERT(Contains(Runner->Commands[0], "command -v rsync"));
    ASSERT(Contains(Runner->Commands[1], "rsync -a --partial"));
    ASSERT(!Contains(Runner->Commands[1], "--checksum"));
    ASSERT(Contains(Runner->Commands[1], Dir.Path("src/a").string()));
}

TEST(filesystem_rsync_failure_raises)
{
    TempDir Dir;
    Dir.Write("src/a/one.txt", "one");
    auto Runner = std::make_shared<FakeCommandRunner>([](const std::string& Command)
    {
        return Contains(Command, "command -v") ? CommandResult{ 0, "" } : CommandResult{ 23, "partial transfer" };
    });
    FilesystemBackend Backend(Runner);

    try
    {
        Backend.Transfer(MakePlan(Dir.Path("src/a").string(), Dir.Path("dst").string()), true, false);
        ASSERT(false);
    }
    catch (const TransferError& e)
    {
        ASSERT_EQ(e.ExitCode, 23);
    }
}

TEST(filesystem_verify_detects_corruption)
{
    TempDir Dir;
    Dir.Write("src/a/good.txt", "good");
    Dir.Write("src/a/bad.txt", "original");
    FS::path DestRoot = Dir.Path("dst");

    // A "resumable copy" that lands one file with the wrong bytes.
    auto Runner = std::make_shared<FakeCommandRunner>([DestRoot](const std::string& Command)
    {
        if (Contains(Command, "rsync -a"))
        {
            FS::create_directories(DestRoot / "a");
            std::ofstream(DestRoot / "a" / "good.txt") << "good";
            std::ofstream(DestRoot / "a" / "bad.txt") << "corrupt";
        }
        return CommandResult{ 0, "" };
    });
    FilesystemBackend Backend(Runner);

    try
    {
        Backend.Transfer(MakePlan(Dir.Path("src/a").string(), DestRoot.string()), true, true);
        ASSERT(false);
    }
    catch (const VerificationError& e)
    {
        ASSERT_EQ(e.RelativePath, "bad.txt");
        ASSERT_EQ(e.SourceDigest, FileHasher::HashFile(Dir.Path("src/a/bad.txt").string()));
        ASSERT_EQ(e.DestinationDigest, FileHasher::HashFile((DestRoot / "a" / "bad.txt").string()));
    }
    ASSERT(Contains(Runner->Commands.back(), "--checksum"));
}

TEST(rsync_push_command)
{
    auto Runner = std::make_shared<FakeCommandRunner>();
    RsyncBackend Backend(Runner, "~/.ssh/my key");
    CopyPlan Plan = MakePlan("/data/logs", "tester@10.10.10.5:/remote/dst");

    Backend.Transfer(Plan, true, true);

    ASSERT_EQ(Runner->Commands.size(), 1u);
    const std::string& Command = Runner->Commands[0];
    ASSERT_EQ(Command.rfind("rsync -avz --partial --checksum -e ", 0), 0u);
    ASSERT(Contains(Command, "-i '\\''~/.ssh/my key'\\''"));
    ASSERT(Contains(Command, " /data/logs tester@10.10.10.5:/remote/dst"));
}

TEST(rsync_pull_command_without_flags)
{
    auto Runner = std::make_shared<FakeCommandRunner>();
    RsyncBackend Backend(Runner);

    Backend.Transfer(MakePlan("eng@host:/var/log", "/tmp/incoming"), false, false);

    const std::string& Command = Runner->Commands[0];
    ASSERT(!Contains(Command, "--partial"));
    ASSERT(!Contains(Command, "--checksum"));
    ASSERT(!Contains(Command, " -i "));
    ASSERT(Contains(Command, " eng@host:/var/log /tmp/incoming"));
}

TEST(rsync_rejects_local_and_remote_only_routes)
{
    auto Runner = std::make_shared<FakeCommandRunner>();
    RsyncBackend Backend(Runner);

    ASSERT_THROWS(Backend.Transfer(MakePlan("/a", "/b"), true, false), UnsupportedRouteError);
    ASSERT_THROWS(Backend.Transfer(MakePlan("u@h1:/a", "u@h2:/b"), true, false), UnsupportedRouteError);
    ASSERT_THROWS(RsyncBackend::CheckRoute(MakePlan("/a", "/b")), UnsupportedRouteError);
    RsyncBackend::CheckRoute(MakePlan("/a", "u@h2:/b"));
    ASSERT(Runner->Commands.empty());
}

TEST(rsync_failure_raises_transfer_error)
{
    auto Runner = std::make_shared<FakeCommandRunner>([](const std::string&) { return CommandResult{ 12, "connection closed" }; });
    RsyncBackend Backend(Runner);
    ASSERT_THROWS(Backend.Transfer(MakePlan("/data", "u@h:/dst"), true, false), TransferError);
}

TEST(rsync_remote_probes_issue_single_commands)
{
    auto Runner = std::make_shared<FakeCommandRunner>([](const std::string& Command)
    {
        if (Contains(Command, "df -Pk"))
        {
            return CommandResult{ 0, "2048\n" };
        }
        if (Contains(Command, "find "))
        {
            return CommandResult{ 0, "alpha\nbeta\n" };
        }
        return CommandResult{ 0, "" };
    });
    RsyncBackend Backend(Runner, "", "eng@host:/data");

    ASSERT(Backend.Connect());
    ASSERT(Backend.Exists("eng@host:/data"));
    Backend.MakeDir("eng@host:/data/new dir");
    ASSERT_EQ(Backend.GetFreeSpace("eng@host:/data"), 2048 * 1024);
    std::vector<std::string> Dirs = Backend.ListDirs("eng@host:/data");

    ASSERT_EQ(Dirs.size(), 2u);
    ASSERT_EQ(Dirs[1], "beta");
    ASSERT_EQ(Runner->Commands.size(), 5u);
    ASSERT(Contains(Runner->Commands[0], "ssh -o BatchMode=yes"));
    ASSERT(Contains(Runner->Commands[0], " eng@host "));
    ASSERT(Contains(Runner->Commands[1], "test -e"));
    ASSERT(Contains(Runner->Commands[2], "mkdir -p"));
    ASSERT(Contains(Runner->Commands[2], "new dir"));
}

TEST(rsync_probe_failures_degrade)
{
    auto Runner = std::make_shared<FakeCommandRunner>([](const std::string&) { return CommandResult{ 255, "unreachable" }; });
    RsyncBackend Backend(Runner, "", "eng@host:/data");

    ASSERT(!Backend.Connect());
    ASSERT(!Backend.Exists("eng@host:/data"));
    ASSERT_EQ(Backend.GetFreeSpace("eng@host:/data"), -1);
    ASSERT(Backend.ListDirs("eng@host:/data").empty());
    Backend.MakeDir("eng@host:/data");
}

TEST(rsync_unparseable_free_space_is_unknown)
{
    auto Runner = std::make_shared<FakeCommandRunner>([](const std::string&) { return CommandResult{ 0, "Filesystem\n" }; });
    RsyncBackend Backend(Runner);
    ASSERT_EQ(Backend.GetFreeSpace("eng@host:/data"), -1);
}

TEST(rsync_local_paths_use_filesystem)
{
    TempDir Dir;
    auto Runner = std::make_shared<FakeCommandRunner>();
    RsyncBackend Backend(Runner);

    ASSERT(Backend.Connect());
    Backend.MakeDir(Dir.Path("pulled").string());
    ASSERT(Backend.Exists(Dir.Path("pulled").string()));
    ASSERT(Backend.GetFreeSpace(Dir.Path("pulled").string()) > 0);
    ASSERT(Runner->Commands.empty());
}

TEST(cloud_stub_records_intent)
{
    CloudBackend Backend;
    ASSERT(Backend.Connect());
    ASSERT_EQ(Backend.GetFreeSpace("scheme://bucket"), -1);
    ASSERT(Backend.Exists("scheme://bucket/p"));
    ASSERT(Backend.ListDirs("scheme://bucket").empty());
    Backend.MakeDir("scheme://bucket/p");

    Backend.Transfer(MakePlan("/data", "scheme://bucket/p"), true, false);
    ASSERT_EQ(Backend.GetUploads().size(), 1u);
    ASSERT_EQ(Backend.GetUploads()[0].Destination, "scheme://bucket/p");
    ASSERT(Backend.GetUploads()[0].Resumable);
    ASSERT(!Backend.GetUploads()[0].Verify);
}

int main()
{
    ConfigGlobal::InitializeDefaults();
    printf("Storage backend tests\n");
    RUN_TEST(hash_is_stable_and_content_sensitive);
    RUN_TEST(filesystem_probes);
    RUN_TEST(filesystem_list_dirs_never_raises);
    RUN_TEST(filesystem_free_space_walks_up_to_existing_ancestor);
    RUN_TEST(filesystem_mkdir_is_idempotent);
    RUN_TEST(filesystem_copies_directory_under_its_name);
    RUN_TEST(filesystem_copies_single_file_into_destination);
    RUN_TEST(filesystem_repeated_copy_matches_source);
    RUN_TEST(filesystem_missing_source_raises);
    RUN_TEST(filesystem_resume_delegates_to_rsync);
    RUN_TEST(filesystem_rsync_failure_raises);
    RUN_TEST(filesystem_verify_detects_corruption);
    RUN_TEST(rsync_push_command);
    RUN_TEST(rsync_pull_command_without_flags);
    RUN_TEST(rsync_rejects_local_and_remote_only_routes);
    RUN_TEST(rsync_failure_raises_transfer_error);
    RUN_TEST(rsync_remote_probes_issue_single_commands);
    RUN_TEST(rsync_probe_failures_degrade);
    RUN_TEST(rsync_unparseable_free_space_is_unknown);
    RUN_TEST(rsync_local_paths_use_filesystem);
    RUN_TEST(cloud_stub_records_intent);
    TEST_SUMMARY();
}
