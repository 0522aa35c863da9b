#pragma once
#include "Gvas.h"
#include <string>
#include <vector>
#include <map>

static const char* const ROSTER_CHARACTERS[] = {
    "DEMI", "Lily", "Kili", "Ela", "Taron",
    "Sova", "Fortune", "Huntress", "Blythe", "Fow-Chan"
};
constexpr int ROSTER_CHARACTER_COUNT = 10;

static const char* const ROSTER_KEYWORDS[] = {
    "Level", "CurrentXP", "BlueBallsXP", "UnspentPP", "CurrentDevotion", "DevotionLevel"
};
constexpr int ROSTER_KEYWORD_COUNT = 6;

struct CharacterField {
    IntProperty prop;
    size_t propIndex = 0;
    int keyword = -1;
    std::string displayName;
};

// keyword index -> field, one map per character in roster order
using CharacterTable = std::vector<std::map<int, CharacterField>>;

int classifyProperty(const std::string& propName);
std::vector<bool> unlockedCharacters(const std::vector<IntProperty>& props);
CharacterTable buildCharacterTable(const std::vector<IntProperty>& props);
std::string characterDisplayName(int character, bool unlocked);
