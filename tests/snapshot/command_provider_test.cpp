#include <gtest/gtest.h>
#include "rpl/snapshot/provider.hpp"

#include "support/temp_dir.hpp"

#include <filesystem>

using namespace rpl;
using namespace rpl::snapshot;

namespace fs = std::filesystem;

namespace {

// Local shell commands standing in for btrfs and ssh
core::SnapshotConfig shell_config(const test::TempDir& dir) {
    core::SnapshotConfig config;
    config.local.snapshot_root = (dir / "snapshots").string();
    config.local.create = {"cp", "-r", "{volume}", "{snapshot_path}"};
    config.local.remove = {"rm", "-rf", "{snapshot_path}"};

    config.remote.exec_prefix = {"env"};
    config.remote.snapshot_root = (dir / "remote-snapshots").string();
    config.remote.share_roots = {{"fs01/projects", (dir / "export").string()}};
    config.remote.create = {"cp", "-r", "{volume}", "{snapshot_path}"};
    config.remote.remove = {"rm", "-rf", "{snapshot_path}"};
    config.remote.exists = {"test", "-e", "{snapshot_path}"};
    config.remote.create_junction = {"ln", "-s", "{snapshot_path}", "{junction_path}"};
    config.remote.remove_junction = {"rm", "-f", "{junction_path}"};
    return config;
}

} // namespace

TEST(CommandSnapshotProvider, LocalCreateAndDelete) {
    test::TempDir dir;
    test::write_bytes(dir / "volume/data.bin", 10);
    process::SystemCommandRunner runner;
    CommandSnapshotProvider provider(shell_config(dir), runner);
    const auto id = ShadowId::generate();

    auto path = provider.create_snapshot({false, "", (dir / "volume").string()}, id);
    ASSERT_TRUE(path.is_ok()) << path.error().message;
    EXPECT_EQ(path.value(), (dir / "snapshots" / id.bare()).string());
    EXPECT_TRUE(fs::exists(fs::path(path.value()) / "data.bin"));

    SnapshotRecord record{id};
    record.snapshot_path = path.value();
    ASSERT_TRUE(provider.delete_snapshot(record).is_ok());
    EXPECT_FALSE(fs::exists(path.value()));

    // Already gone
    EXPECT_TRUE(provider.delete_snapshot(record).is_ok());
}

TEST(CommandSnapshotProvider, FailingCommandIsResourceAcquisition) {
    test::TempDir dir;
    process::SystemCommandRunner runner;
    auto config = shell_config(dir);
    config.local.create = {"/bin/sh", "-c", "echo 'not a btrfs subvolume' >&2; exit 1"};
    CommandSnapshotProvider provider(config, runner);

    auto path = provider.create_snapshot({false, "", dir.str()}, ShadowId::generate());

    ASSERT_TRUE(path.is_error());
    EXPECT_EQ(path.error().kind, ErrorKind::ResourceAcquisition);
    EXPECT_NE(path.error().message.find("not a btrfs subvolume"), std::string::npos);
}

TEST(CommandSnapshotProvider, RemoteVolumeFromShareRoots) {
    test::TempDir dir;
    process::SystemCommandRunner runner;
    CommandSnapshotProvider provider(shell_config(dir), runner);

    auto known = provider.remote_volume(UncPath("\\\\FS01\\Projects\\eng"));
    auto unknown = provider.remote_volume(UncPath("\\\\fs02\\archive"));

    ASSERT_TRUE(known.is_ok());
    EXPECT_EQ(known.value(), (dir / "export").string());
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().kind, ErrorKind::ResourceAcquisition);
}

TEST(CommandSnapshotProvider, RemoteJunctionLifecycle) {
    test::TempDir dir;
    test::write_bytes(dir / "export/eng/data.bin", 10);
    fs::create_directories(dir / "remote-snapshots");
    process::SystemCommandRunner runner;
    CommandSnapshotProvider provider(shell_config(dir), runner);

    SnapshotRecord record{ShadowId::generate()};
    record.is_remote = true;
    record.server = "fs01";
    record.source_volume = (dir / "export").string();

    auto path = provider.create_snapshot({true, "fs01", record.source_volume}, record.shadow_id);
    ASSERT_TRUE(path.is_ok()) << path.error().message;
    record.snapshot_path = path.value();

    auto junction = provider.create_junction(record);
    ASSERT_TRUE(junction.is_ok()) << junction.error().message;
    EXPECT_EQ(fs::path(junction.value()).filename().string(),
              CommandSnapshotProvider::junction_name(record.shadow_id));
    EXPECT_TRUE(fs::exists(fs::path(junction.value()) / "eng/data.bin"));
    record.junction_path = junction.value();

    ASSERT_TRUE(provider.delete_junction(record).is_ok());
    EXPECT_FALSE(fs::exists(fs::symlink_status(junction.value())));

    ASSERT_TRUE(provider.delete_snapshot(record).is_ok());
    EXPECT_FALSE(fs::exists(record.snapshot_path));
    EXPECT_TRUE(provider.delete_snapshot(record).is_ok());
}

TEST(CommandSnapshotProvider, JunctionNameUsesIdPrefix) {
    const ShadowId id("{1234abcd-0000-0000-0000-000000000000}");

    EXPECT_EQ(CommandSnapshotProvider::junction_name(id), ".rpl-snapshot-1234abcd");
}
