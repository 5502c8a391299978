#include <gtest/gtest.h>
#include "rpl/core/identifiers.hpp"

#include <set>
#include <stdexcept>
#include <unordered_set>

using namespace rpl;

TEST(DriveLetter, NormalisesToUpperCase) {
    EXPECT_EQ(DriveLetter('z').value(), 'Z');
    EXPECT_EQ(DriveLetter("e:").str(), "E");
    EXPECT_EQ(DriveLetter("Q:\\").str(), "Q");
    EXPECT_EQ(DriveLetter('x'), DriveLetter("X"));
}

TEST(DriveLetter, RejectsMalformedInput) {
    EXPECT_THROW(DriveLetter('1'), std::invalid_argument);
    EXPECT_THROW(DriveLetter(""), std::invalid_argument);
    EXPECT_THROW(DriveLetter("ZZ"), std::invalid_argument);
    EXPECT_THROW(DriveLetter(":"), std::invalid_argument);
}

TEST(ShadowId, AcceptsBracedGuid) {
    ShadowId id("{A1B2C3D4-0000-1111-2222-333344445555}");
    EXPECT_EQ(id.str(), "{a1b2c3d4-0000-1111-2222-333344445555}");
    EXPECT_EQ(id.bare(), "a1b2c3d4-0000-1111-2222-333344445555");
}

TEST(ShadowId, RejectsMalformedGuid) {
    EXPECT_THROW(ShadowId("a1b2c3d4-0000-1111-2222-333344445555"), std::invalid_argument);
    EXPECT_THROW(ShadowId("{a1b2c3d4-0000-1111-2222-33334444555g}"), std::invalid_argument);
    EXPECT_THROW(ShadowId("{a1b2c3d40000-1111-2222-3333-44445555}"), std::invalid_argument);
    EXPECT_THROW(ShadowId("{}"), std::invalid_argument);
}

TEST(ShadowId, GeneratedIdsAreValidAndDistinct) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto id = ShadowId::generate();
        EXPECT_NO_THROW(ShadowId(id.str()));
        seen.insert(id.str());
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(UncPath, ParsesEitherSeparator) {
    UncPath a("\\\\fs01\\projects\\eng\\src");
    UncPath b("//fs01/projects/eng/src");

    EXPECT_EQ(a.server(), "fs01");
    EXPECT_EQ(a.share(), "projects");
    EXPECT_EQ(a.remainder(), "eng\\src");
    EXPECT_EQ(a.str(), b.str());
    EXPECT_EQ(b.root(), "\\\\fs01\\projects");
    EXPECT_EQ(b.posix(), "//fs01/projects/eng/src");
    EXPECT_EQ(b.remainder_posix(), "eng/src");
}

TEST(UncPath, SameRootIgnoresCase) {
    EXPECT_TRUE(UncPath("//FS01/Projects/a").same_root(UncPath("\\\\fs01\\projects")));
    EXPECT_FALSE(UncPath("//fs01/projects").same_root(UncPath("//fs01/home")));
}

TEST(UncPath, RejectsIncompletePaths) {
    EXPECT_THROW(UncPath("/srv/projects"), std::invalid_argument);
    EXPECT_THROW(UncPath("//fs01"), std::invalid_argument);
    EXPECT_THROW(UncPath("//fs01/share/../etc"), std::invalid_argument);
    EXPECT_FALSE(UncPath::looks_like_unc("C:\\data"));
    EXPECT_TRUE(UncPath::looks_like_unc("\\\\fs01\\share"));
}

TEST(ChunkId, SixteenHexDigits) {
    EXPECT_EQ(ChunkId("00FF00FF00FF00FF").str(), "00ff00ff00ff00ff");
    EXPECT_THROW(ChunkId("00ff"), std::invalid_argument);
    EXPECT_THROW(ChunkId("00ff00ff00ff00fz"), std::invalid_argument);
    EXPECT_EQ(ChunkId::from_hash(0xabcdefULL).str(), "0000000000abcdef");
}

TEST(ChunkId, UsableAsHashKey) {
    std::unordered_set<ChunkId> ids;
    ids.insert(ChunkId::from_hash(1));
    ids.insert(ChunkId::from_hash(1));
    ids.insert(ChunkId::from_hash(2));
    EXPECT_EQ(ids.size(), 2u);
}
