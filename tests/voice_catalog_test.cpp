#include <set>

#include <gtest/gtest.h>

#include "speakd/voice_catalog.hpp"

using namespace speakd;

TEST(VoiceCatalog, GroupsInFixedOrder) {
    const auto& catalog = voiceCatalog();
    ASSERT_EQ(catalog.size(), 4u);
    EXPECT_EQ(catalog[0].label, "American Female");
    EXPECT_EQ(catalog[1].label, "American Male");
    EXPECT_EQ(catalog[2].label, "British Female");
    EXPECT_EQ(catalog[3].label, "British Male");

    EXPECT_EQ(catalog[0].voices.size(), 11u);
    EXPECT_EQ(catalog[1].voices.size(), 9u);
    EXPECT_EQ(catalog[2].voices.size(), 4u);
    EXPECT_EQ(catalog[3].voices.size(), 4u);
}

TEST(VoiceCatalog, MarksDefaultVoice) {
    const auto& first = voiceCatalog().front().voices.front();
    EXPECT_EQ(first, std::string(kDefaultVoice) + " (default)");
}

TEST(VoiceCatalog, SameInstanceEveryTime) {
    EXPECT_EQ(&voiceCatalog(), &voiceCatalog());
    EXPECT_EQ(voiceCatalog()[3].voices.back(), "bm_lewis");
}

TEST(VoiceCatalog, BaseNameDropsCatalogSuffix) {
    EXPECT_EQ(baseVoiceName("af_heart (default)"), "af_heart");
    EXPECT_EQ(baseVoiceName("af_heart(default)"), "af_heart");
    EXPECT_EQ(baseVoiceName("af_heart"), "af_heart");
    EXPECT_EQ(baseVoiceName("  bm_fable "), "bm_fable");
    EXPECT_EQ(baseVoiceName(""), "");
    EXPECT_EQ(baseVoiceName("   "), "");
}

TEST(VoiceCatalog, EveryEntryHasADistinctBaseName) {
    std::set<std::string> seen;
    for (const auto& group : voiceCatalog()) {
        for (const auto& v : group.voices) {
            EXPECT_TRUE(seen.insert(baseVoiceName(v)).second) << v;
        }
    }
    EXPECT_EQ(seen.count(kDefaultVoice), 1u);
}
