#include <gtest/gtest.h>
#include "rpl/network/resource_manager.hpp"

#include "support/temp_dir.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

using namespace rpl;
using namespace rpl::network;

namespace {

class FakeMapper : public NetworkMapper {
public:
    bool is_letter_in_use(DriveLetter letter) override {
        return in_use.count(letter.value()) > 0;
    }

    Result<std::string> map(DriveLetter letter, const UncPath& root,
                            const credentials::Credential* credential) override {
        ++map_calls;
        last_user = credential ? credential->user() : "";
        if (conflicts_left > 0) {
            --conflicts_left;
            in_use.insert(letter.value());
            return Err<std::string>(ErrorKind::Conflict, "letter grabbed by someone else");
        }
        if (fail_map) {
            return Err<std::string>(ErrorKind::Io, "access denied");
        }
        mapped[letter.value()] = root.root();
        return Ok("/mnt/rpl/" + letter.str());
    }

    Result<void> unmap(DriveLetter letter) override {
        ++unmap_calls;
        if (fail_unmap) {
            return Err<void>(ErrorKind::Io, "device busy");
        }
        mapped.erase(letter.value());
        return Ok();
    }

    std::set<char> in_use;
    std::map<char, std::string> mapped;
    int conflicts_left = 0;
    bool fail_map = false;
    bool fail_unmap = false;
    int map_calls = 0;
    int unmap_calls = 0;
    std::string last_user;
};

core::NetworkConfig network_config(std::string letters = "ZYX", std::uint32_t attempts = 5) {
    core::NetworkConfig config;
    config.letters = std::move(letters);
    config.max_letter_attempts = attempts;
    return config;
}

struct Fixture {
    explicit Fixture(core::NetworkConfig config = network_config())
        : manager(mapper, ledger, config) {}

    test::TempDir dir;
    MappingLedger ledger{dir / "mappings.json"};
    FakeMapper mapper;
    NetworkResourceManager manager;
};

} // namespace

TEST(NetworkResourceManager, PicksLettersFromTheTop) {
    Fixture f;

    auto first = f.manager.mount("\\\\fs01\\projects\\eng", nullptr);
    auto second = f.manager.mount("\\\\fs02\\archive", nullptr);

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value().letter.value(), 'Z');
    EXPECT_EQ(second.value().letter.value(), 'Y');
    EXPECT_EQ(first.value().remote_root, "\\\\fs01\\projects");
    EXPECT_EQ(first.value().original_path, "\\\\fs01\\projects\\eng");
    EXPECT_EQ(first.value().mapped_path, "/mnt/rpl/Z");
    EXPECT_EQ(f.ledger.list().size(), 2u);
    EXPECT_EQ(f.manager.active().size(), 2u);
}

TEST(NetworkResourceManager, SkipsLettersAlreadyInUse) {
    Fixture f;
    f.mapper.in_use.insert('Z');

    auto record = f.manager.mount("\\\\fs01\\projects", nullptr);

    ASSERT_TRUE(record.is_ok());
    EXPECT_EQ(record.value().letter.value(), 'Y');
}

TEST(NetworkResourceManager, ReusesMappingForSameShare) {
    Fixture f;

    auto first = f.manager.mount("\\\\fs01\\projects\\eng", nullptr);
    auto second = f.manager.mount("\\\\FS01\\Projects\\ops", nullptr);

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().letter, first.value().letter);
    EXPECT_EQ(f.mapper.map_calls, 1);
    EXPECT_EQ(f.ledger.list().size(), 1u);
}

TEST(NetworkResourceManager, RetriesOnLetterConflict) {
    Fixture f;
    f.mapper.conflicts_left = 2;

    auto record = f.manager.mount("\\\\fs01\\projects", nullptr);

    ASSERT_TRUE(record.is_ok());
    EXPECT_EQ(record.value().letter.value(), 'X');
    EXPECT_EQ(f.mapper.map_calls, 3);
}

TEST(NetworkResourceManager, GivesUpAfterMaxConflicts) {
    Fixture f(network_config("ZYXWVU", 3));
    f.mapper.conflicts_left = 10;

    auto record = f.manager.mount("\\\\fs01\\projects", nullptr);

    ASSERT_TRUE(record.is_error());
    EXPECT_EQ(record.error().kind, ErrorKind::ResourceAcquisition);
    EXPECT_EQ(f.mapper.map_calls, 3);
    EXPECT_TRUE(f.ledger.list().empty());
}

TEST(NetworkResourceManager, RunsOutOfLetters) {
    Fixture f(network_config("Z"));
    f.mapper.in_use.insert('Z');

    auto record = f.manager.mount("\\\\fs01\\projects", nullptr);

    ASSERT_TRUE(record.is_error());
    EXPECT_EQ(record.error().kind, ErrorKind::ResourceAcquisition);
}

TEST(NetworkResourceManager, MapFailureIsResourceAcquisition) {
    Fixture f;
    f.mapper.fail_map = true;

    auto record = f.manager.mount("\\\\fs01\\projects", nullptr);

    ASSERT_TRUE(record.is_error());
    EXPECT_EQ(record.error().kind, ErrorKind::ResourceAcquisition);
    EXPECT_TRUE(f.manager.active().empty());
}

TEST(NetworkResourceManager, RejectsNonUncPath) {
    Fixture f;

    auto record = f.manager.mount("/srv/data", nullptr);

    ASSERT_TRUE(record.is_error());
    EXPECT_EQ(record.error().kind, ErrorKind::InvalidArgument);
}

TEST(NetworkResourceManager, PassesCredentialToMapper) {
    Fixture f;
    credentials::Credential credential("svc-backup", "hunter2");

    ASSERT_TRUE(f.manager.mount("\\\\fs01\\projects", &credential).is_ok());

    EXPECT_EQ(f.mapper.last_user, "svc-backup");
}

TEST(NetworkResourceManager, UnmountIsIdempotent) {
    Fixture f;
    auto record = f.manager.mount("\\\\fs01\\projects", nullptr);
    ASSERT_TRUE(record.is_ok());

    ASSERT_TRUE(f.manager.unmount(record.value()).is_ok());
    ASSERT_TRUE(f.manager.unmount(record.value()).is_ok());

    EXPECT_EQ(f.mapper.unmap_calls, 1);
    EXPECT_TRUE(f.ledger.list().empty());
    EXPECT_TRUE(f.manager.active().empty());
}

TEST(NetworkResourceManager, FailedUnmountKeepsRecord) {
    Fixture f;
    auto record = f.manager.mount("\\\\fs01\\projects", nullptr);
    ASSERT_TRUE(record.is_ok());
    f.mapper.fail_unmap = true;

    EXPECT_TRUE(f.manager.unmount(record.value()).is_error());
    EXPECT_EQ(f.ledger.list().size(), 1u);
    EXPECT_EQ(f.manager.active().size(), 1u);
}

TEST(NetworkResourceManager, ReconcileReleasesEveryOrphan) {
    test::TempDir dir;
    {
        MappingLedger ledger(dir / "mappings.json");
        FakeMapper mapper;
        NetworkResourceManager manager(mapper, ledger, network_config());
        ASSERT_TRUE(manager.mount("\\\\fs01\\projects", nullptr).is_ok());
        ASSERT_TRUE(manager.mount("\\\\fs02\\archive", nullptr).is_ok());
    }

    MappingLedger ledger(dir / "mappings.json");
    FakeMapper mapper;
    NetworkResourceManager manager(mapper, ledger, network_config());

    auto report = manager.reconcile_orphans();

    EXPECT_EQ(report.found, 2u);
    EXPECT_EQ(report.released, 2u);
    EXPECT_EQ(mapper.unmap_calls, 2);
    EXPECT_TRUE(ledger.list().empty());
}

TEST(NetworkResourceManager, RemapRewritesHeldShares) {
    Fixture f;
    ASSERT_TRUE(f.manager.mount("\\\\fs01\\projects", nullptr).is_ok());

    EXPECT_EQ(f.manager.remap("\\\\fs01\\projects\\eng\\cad"), "/mnt/rpl/Z/eng/cad");
    EXPECT_EQ(f.manager.remap("\\\\fs01\\projects"), "/mnt/rpl/Z");
    EXPECT_EQ(f.manager.remap("\\\\fs09\\other\\x"), "\\\\fs09\\other\\x");
    EXPECT_EQ(f.manager.remap("/srv/data"), "/srv/data");
}
