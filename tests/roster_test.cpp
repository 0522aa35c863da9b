#include "test_helpers.h"
#include "roster.h"

static std::vector<IntProperty> scanRoster(int characters) {
    GVASFile gvas;
    gvas.load(buildRosterSave(characters));
    return gvas.scanIntProperties();
}

TEST(Roster, ClassifiesByLeadingNamePart) {
    EXPECT_EQ(classifyProperty("Level_2_6C1B8E0F"), 0);
    EXPECT_EQ(classifyProperty("CurrentXP_3_AB"), 1);
    EXPECT_EQ(classifyProperty("BlueBallsXP_4_AB"), 2);
    EXPECT_EQ(classifyProperty("UnspentPP_5_AB"), 3);
    EXPECT_EQ(classifyProperty("CurrentDevotion_6_AB"), 4);
    EXPECT_EQ(classifyProperty("DevotionLevel_7_AB"), 5);
    EXPECT_EQ(classifyProperty("DevotionLevel"), -1);
    EXPECT_EQ(classifyProperty("Level"), -1);
    EXPECT_EQ(classifyProperty("Credits_2_AB"), -1);
    EXPECT_EQ(classifyProperty("LevelCap_2_AB"), -1);
}

TEST(Roster, PartialNameMatchesFirstContainingKeyword) {
    // "XP" is contained in both CurrentXP and BlueBallsXP; keyword order decides.
    EXPECT_EQ(classifyProperty("XP_1_AB"), 1);
    EXPECT_EQ(classifyProperty("Devotion_1_AB"), 4);
}

TEST(Roster, TopLevelFieldWithoutSuffixDoesNotShiftCharacters) {
    std::vector<uint8_t> data = gvasHeader();
    appendIntProperty(data, "Level", 55);
    std::vector<uint8_t> roster = buildRosterSave(2);
    data.insert(data.end(), roster.begin() + gvasHeader().size(), roster.end());

    GVASFile gvas;
    ASSERT_TRUE(gvas.load(data));
    std::vector<IntProperty> props = gvas.scanIntProperties();
    ASSERT_EQ(props.size(), static_cast<size_t>(1 + 2 * ROSTER_KEYWORD_COUNT));
    EXPECT_EQ(props[0].name, "Level");

    CharacterTable table = buildCharacterTable(props);
    EXPECT_EQ(table[0].at(0).prop.value, 0u);
    EXPECT_EQ(table[0].at(0).propIndex, 1u);
    EXPECT_EQ(table[1].at(0).prop.value, 100u);
    EXPECT_TRUE(table[2].empty());

    std::vector<bool> unlocked = unlockedCharacters(props);
    EXPECT_TRUE(unlocked[0]);
    EXPECT_TRUE(unlocked[1]);
    EXPECT_FALSE(unlocked[2]);
}

TEST(Roster, AssignsOccurrencesToCharactersInOrder) {
    CharacterTable table = buildCharacterTable(scanRoster(3));
    ASSERT_EQ(table.size(), static_cast<size_t>(ROSTER_CHARACTER_COUNT));

    for (int c = 0; c < 3; c++) {
        ASSERT_EQ(table[c].size(), static_cast<size_t>(ROSTER_KEYWORD_COUNT)) << ROSTER_CHARACTERS[c];
        for (int k = 0; k < ROSTER_KEYWORD_COUNT; k++) {
            const CharacterField& f = table[c].at(k);
            EXPECT_EQ(f.prop.value, static_cast<uint32_t>(c * 100 + k));
            EXPECT_EQ(f.keyword, k);
            EXPECT_EQ(f.propIndex, static_cast<size_t>(c * ROSTER_KEYWORD_COUNT + k));
        }
    }
    EXPECT_EQ(table[0].at(0).displayName, "Level (1)");
    EXPECT_EQ(table[2].at(5).displayName, "DevotionLevel (3)");
    EXPECT_TRUE(table[3].empty());
}

TEST(Roster, UnlockedRequiresEveryKeyword) {
    std::vector<IntProperty> props = scanRoster(2);
    // Kili and Ela each receive only a Level.
    props.push_back(IntProperty{"Level_2_AB", 1, 0});
    props.push_back(IntProperty{"Level_2_AB", 1, 0});

    std::vector<bool> unlocked = unlockedCharacters(props);
    ASSERT_EQ(unlocked.size(), static_cast<size_t>(ROSTER_CHARACTER_COUNT));
    EXPECT_TRUE(unlocked[0]);
    EXPECT_TRUE(unlocked[1]);
    EXPECT_FALSE(unlocked[2]);
    EXPECT_FALSE(unlocked[3]);

    CharacterTable table = buildCharacterTable(props);
    EXPECT_EQ(table[2].size(), 1u);
    EXPECT_EQ(table[3].size(), 1u);
}

TEST(Roster, OccurrencesBeyondRosterAreIgnored) {
    std::vector<IntProperty> props = scanRoster(ROSTER_CHARACTER_COUNT);
    props.push_back(IntProperty{"Level_2_AB", 999, 0});

    CharacterTable table = buildCharacterTable(props);
    EXPECT_EQ(table[ROSTER_CHARACTER_COUNT - 1].at(0).prop.value, 900u);
    std::vector<bool> unlocked = unlockedCharacters(props);
    for (int c = 0; c < ROSTER_CHARACTER_COUNT; c++) EXPECT_TRUE(unlocked[c]) << ROSTER_CHARACTERS[c];
}

TEST(Roster, DisplayNameMarksLockedCharacters) {
    EXPECT_EQ(characterDisplayName(0, true), "DEMI");
    EXPECT_EQ(characterDisplayName(9, false), "Fow-Chan (Not Unlocked)");
    EXPECT_EQ(characterDisplayName(10, true), "?");
}
