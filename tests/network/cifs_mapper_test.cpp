#include <gtest/gtest.h>
#include "rpl/network/mapper.hpp"

#include "support/temp_dir.hpp"

#include <filesystem>

using namespace rpl;
using namespace rpl::network;

namespace {

core::NetworkConfig shell_config(const test::TempDir& dir) {
    core::NetworkConfig config;
    config.mount_root = (dir / "mnt").string();
    // Records what the mount helper would receive instead of mounting
    config.mount = {"/bin/sh", "-c", "printf '%s %s %s' \"$USER\" \"$PASSWD\" {remote} > {mount_point}/.args"};
    config.unmount = {"/bin/sh", "-c", "exit 0"};
    return config;
}

} // namespace

TEST(CifsNetworkMapper, MountPointPerLetter) {
    test::TempDir dir;
    process::SystemCommandRunner runner;
    CifsNetworkMapper mapper(shell_config(dir), runner);

    EXPECT_EQ(mapper.mount_point(DriveLetter('Z')), (dir / "mnt/Z").string());
    EXPECT_FALSE(mapper.is_letter_in_use(DriveLetter('Z')));
}

TEST(CifsNetworkMapper, PassesCredentialThroughEnvironment) {
    test::TempDir dir;
    process::SystemCommandRunner runner;
    CifsNetworkMapper mapper(shell_config(dir), runner);
    credentials::Credential credential("svc-backup", "hunter2");

    auto mapped = mapper.map(DriveLetter('Y'), UncPath("\\\\fs01\\projects"), &credential);

    ASSERT_TRUE(mapped.is_ok()) << mapped.error().message;
    EXPECT_EQ(mapped.value(), (dir / "mnt/Y").string());
    EXPECT_EQ(test::slurp(dir / "mnt/Y/.args"), "svc-backup hunter2 //fs01/projects");
}

TEST(CifsNetworkMapper, HelperFailureIsResourceAcquisition) {
    test::TempDir dir;
    process::SystemCommandRunner runner;
    auto config = shell_config(dir);
    config.mount = {"/bin/sh", "-c", "echo 'mount error(13): Permission denied'; exit 32"};
    CifsNetworkMapper mapper(config, runner);

    auto mapped = mapper.map(DriveLetter('Z'), UncPath("\\\\fs01\\projects"), nullptr);

    ASSERT_TRUE(mapped.is_error());
    EXPECT_EQ(mapped.error().kind, ErrorKind::ResourceAcquisition);
    EXPECT_NE(mapped.error().message.find("Permission denied"), std::string::npos);
}

TEST(CifsNetworkMapper, UnmapOfUnmountedLetterIsNoop) {
    test::TempDir dir;
    process::SystemCommandRunner runner;
    auto config = shell_config(dir);
    config.unmount = {"/bin/sh", "-c", "exit 1"};
    CifsNetworkMapper mapper(config, runner);

    EXPECT_TRUE(mapper.unmap(DriveLetter('Z')).is_ok());
}

TEST(MountTable, RootIsMounted) {
    EXPECT_TRUE(is_mount_point("/"));
    EXPECT_FALSE(is_mount_point("/definitely/not/a/mount/point"));
}
