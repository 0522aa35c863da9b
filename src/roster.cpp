#include "roster.h"
#include <iostream>

// Only blueprint struct members (carrying a "_<n>_<guid>" suffix) belong to
// the roster; a bare top-level "Level" is some other counter. The leading part
// identifies the stat, first keyword containing it wins.
int classifyProperty(const std::string& propName) {
    size_t underscore = propName.find('_');
    if (underscore == std::string::npos) return -1;
    std::string head = propName.substr(0, underscore);
    for (int k = 0; k < ROSTER_KEYWORD_COUNT; k++) {
        if (std::string(ROSTER_KEYWORDS[k]).find(head) != std::string::npos) return k;
    }
    return -1;
}

CharacterTable buildCharacterTable(const std::vector<IntProperty>& props) {
    CharacterTable table(ROSTER_CHARACTER_COUNT);
    int occurrences[ROSTER_KEYWORD_COUNT] = {0};

    for (size_t i = 0; i < props.size(); i++) {
        int k = classifyProperty(props[i].name);
        if (k < 0) continue;
        int character = occurrences[k];
        if (character >= ROSTER_CHARACTER_COUNT) continue;
        occurrences[k]++;

        CharacterField field;
        field.prop = props[i];
        field.propIndex = i;
        field.keyword = k;
        field.displayName = std::string(ROSTER_KEYWORDS[k]) + " (" + std::to_string(character + 1) + ")";
        table[character][k] = field;
    }
    return table;
}

std::vector<bool> unlockedCharacters(const std::vector<IntProperty>& props) {
    CharacterTable table = buildCharacterTable(props);
    std::vector<bool> unlocked(ROSTER_CHARACTER_COUNT, false);
    int count = 0;
    for (int c = 0; c < ROSTER_CHARACTER_COUNT; c++) {
        unlocked[c] = static_cast<int>(table[c].size()) >= ROSTER_KEYWORD_COUNT;
        if (unlocked[c]) count++;
    }
    std::cout << "[ROSTER] " << count << "/" << ROSTER_CHARACTER_COUNT << " characters unlocked" << std::endl;
    return unlocked;
}

std::string characterDisplayName(int character, bool unlocked) {
    if (character < 0 || character >= ROSTER_CHARACTER_COUNT) return "?";
    std::string name = ROSTER_CHARACTERS[character];
    if (!unlocked) name += " (Not Unlocked)";
    return name;
}
