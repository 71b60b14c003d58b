#include "test.hpp"

#include "bc/core/Version.hpp"

TEST(ProjectInfo, NameIsBasalcount)
{
    EXPECT_EQ(ProjectInfo::Name(), std::string("basalcount"));
}

TEST(ProjectInfo, VersionStringIsDotted)
{
    const std::string dotted = std::to_string(ProjectInfo::VersionMajor()) + "." +
                               std::to_string(ProjectInfo::VersionMinor()) + "." +
                               std::to_string(ProjectInfo::VersionPatch());
    EXPECT_EQ(ProjectInfo::VersionString(), dotted);
    EXPECT_EQ(ProjectInfo::NameAndVersion(), std::string("basalcount ") + dotted);
}

// run_config.json and --version report these; "unknown" outside a git checkout
TEST(ProjectInfo, ShortHashPrefixesFullHash)
{
    const std::string full = ProjectInfo::RepositoryHash();
    const std::string shortHash = ProjectInfo::RepositoryShortHash();
    EXPECT_FALSE(full.empty());
    EXPECT_FALSE(shortHash.empty());
    if (full != "unknown") {
        EXPECT_EQ(full.compare(0, shortHash.size(), shortHash), 0);
    } else {
        EXPECT_EQ(shortHash, std::string("unknown"));
    }
}
