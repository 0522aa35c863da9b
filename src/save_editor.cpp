#include "save_editor.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <stdexcept>

void postEditorMessage(SaveEditorState& state, EditorMessageKind kind,
                       const std::string& title, const std::string& text) {
    state.pendingMessage.kind = kind;
    state.pendingMessage.title = title;
    state.pendingMessage.text = text;
    state.statusMessage = text;
}

static void resetEdits(SaveEditorState& state) {
    state.edits.clear();
    if (state.selectedCharacter < 0 || state.selectedCharacter >= (int)state.table.size()) return;
    for (const auto& [keyword, field] : state.table[state.selectedCharacter]) {
        SaveEditorState::FieldEdit edit;
        snprintf(edit.text, sizeof(edit.text), "%u", field.prop.value);
        state.edits[keyword] = edit;
    }
}

bool openSaveFile(SaveEditorState& state, const std::string& path) {
    std::string backupDir = state.backupDir;
    state.clear();
    state.backupDir = backupDir;

    if (!state.save.load(path)) {
        postEditorMessage(state, EditorMessageKind::Error, "Error",
                          "Failed to load file: cannot read " + path);
        return false;
    }

    state.properties = state.save.scanIntProperties();
    state.table = buildCharacterTable(state.properties);
    state.unlocked = unlockedCharacters(state.properties);
    state.loadPath = path;
    setSaveTarget(state, path);
    state.fileLoaded = true;
    selectCharacter(state, 0);
    state.statusMessage = "Loaded: " + fs::path(path).filename().string() + " (" +
                          std::to_string(state.properties.size()) + " integer fields)";
    if (state.savePathTruncated) {
        postEditorMessage(state, EditorMessageKind::Warning, "Warning",
                          "The path is too long to show in full. Save as will start from the loaded file.");
    }
    return true;
}

void selectCharacter(SaveEditorState& state, int character) {
    if (character < 0 || character >= ROSTER_CHARACTER_COUNT) return;
    state.selectedCharacter = character;
    resetEdits(state);
}

void setSaveTarget(SaveEditorState& state, const std::string& path) {
    state.saveTarget = path;
    strncpy(state.savePathInput, path.c_str(), sizeof(state.savePathInput) - 1);
    state.savePathInput[sizeof(state.savePathInput) - 1] = '\0';
    state.savePathTruncated = path.size() >= sizeof(state.savePathInput);
    if (state.savePathTruncated)
        std::cout << "[SAV] Save path exceeds " << sizeof(state.savePathInput) - 1
                  << " bytes, keeping full path aside" << std::endl;
}

// While the input box still shows the clipped prefix, the stored target is the real one.
std::string saveTargetPath(const SaveEditorState& state) {
    if (state.savePathTruncated &&
        state.saveTarget.compare(0, sizeof(state.savePathInput) - 1, state.savePathInput) == 0)
        return state.saveTarget;
    return state.savePathInput;
}

const CharacterField* findCharacterField(const SaveEditorState& state, int keyword) {
    if (state.selectedCharacter < 0 || state.selectedCharacter >= (int)state.table.size()) return nullptr;
    const auto& fields = state.table[state.selectedCharacter];
    auto it = fields.find(keyword);
    if (it == fields.end()) return nullptr;
    return &it->second;
}

void markFieldEdited(SaveEditorState& state, int keyword) {
    auto it = state.edits.find(keyword);
    if (it != state.edits.end()) it->second.modified = true;
}

std::string fieldLabel(const SaveEditorState& state, int keyword) {
    const CharacterField* field = findCharacterField(state, keyword);
    if (!field) return "";
    auto it = state.edits.find(keyword);
    if (it != state.edits.end() && it->second.modified) return "* " + field->displayName;
    return field->displayName;
}

bool parseFieldValue(const std::string& text, uint32_t& out) {
    auto first = std::find_if(text.begin(), text.end(), [](unsigned char c) { return !std::isspace(c); });
    auto last = std::find_if(text.rbegin(), text.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    if (first >= last) return false;
    std::string s(first, last);
    if (s[0] == '-') {
        // "-0" is still zero
        if (s.find_first_not_of('0', 1) != std::string::npos || s.size() == 1) return false;
        out = 0;
        return true;
    }
    try {
        size_t consumed = 0;
        unsigned long long v = std::stoull(s, &consumed, 10);
        if (consumed != s.size() || v > 0xFFFFFFFFull) return false;
        out = static_cast<uint32_t>(v);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool applyFieldEdit(SaveEditorState& state, int keyword, const std::string& text) {
    if (!state.fileLoaded) return false;
    const CharacterField* field = findCharacterField(state, keyword);
    if (!field) return false;
    std::string name = field->prop.name;

    uint32_t newVal = 0;
    if (!parseFieldValue(text, newVal)) {
        postEditorMessage(state, EditorMessageKind::Warning, "Invalid",
                          "Enter a valid integer for " + name);
        return false;
    }

    size_t propIndex = field->propIndex;
    if (!state.save.writeUInt32At(field->prop.offset, newVal)) {
        postEditorMessage(state, EditorMessageKind::Error, "Error",
                          "Offset out of range for " + name);
        return false;
    }

    state.properties[propIndex].value = newVal;
    state.table[state.selectedCharacter][keyword].prop.value = newVal;
    state.hasUnsavedChanges = true;
    std::cout << "[SAV] " << name << " @" << field->prop.offset << " = " << newVal << std::endl;
    postEditorMessage(state, EditorMessageKind::Info, "Applied",
                      "Applied new value " + std::to_string(newVal) + " to " + name);
    return true;
}

bool writeSaveFile(SaveEditorState& state, const std::string& path) {
    if (!state.fileLoaded) {
        postEditorMessage(state, EditorMessageKind::Warning, "Warning", "No file loaded.");
        return false;
    }
    if (path.empty()) {
        postEditorMessage(state, EditorMessageKind::Error, "Error", "Failed to save file: no path given");
        return false;
    }

    std::error_code ec;
    if (fs::exists(path, ec) && !GVASFile::createBackup(path, state.backupDir)) {
        postEditorMessage(state, EditorMessageKind::Error, "Error",
                          "Failed to save file: could not back up " + path);
        return false;
    }

    if (!state.save.save(path)) {
        postEditorMessage(state, EditorMessageKind::Error, "Error",
                          "Failed to save file: cannot write " + path);
        return false;
    }

    state.hasUnsavedChanges = false;
    setSaveTarget(state, path);
    postEditorMessage(state, EditorMessageKind::Info, "Success", "File saved to " + path);
    return true;
}

bool canRestoreBackup(const SaveEditorState& state) {
    return state.fileLoaded && GVASFile::backupExists(state.loadPath, state.backupDir);
}

bool restoreSaveBackup(SaveEditorState& state) {
    if (!state.fileLoaded) return false;
    std::string path = state.loadPath;
    if (!GVASFile::restoreBackup(path, state.backupDir)) {
        postEditorMessage(state, EditorMessageKind::Error, "Error", "Failed to restore backup of " + path);
        return false;
    }
    if (!openSaveFile(state, path)) return false;
    postEditorMessage(state, EditorMessageKind::Info, "Restored", "Restored " + path + " from backup");
    return true;
}
