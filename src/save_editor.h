#pragma once
#include "Gvas.h"
#include "roster.h"
#include <string>
#include <vector>
#include <map>

enum class EditorMessageKind { None, Info, Warning, Error };

struct EditorMessage {
    EditorMessageKind kind = EditorMessageKind::None;
    std::string title;
    std::string text;
};

struct SaveEditorState {
    GVASFile save;
    std::vector<IntProperty> properties;
    CharacterTable table;
    std::vector<bool> unlocked;
    bool fileLoaded = false;

    std::string loadPath;
    char savePathInput[1024] = {0};
    std::string saveTarget;
    bool savePathTruncated = false;
    std::string backupDir = "save_backups";

    int selectedCharacter = 0;
    struct FieldEdit {
        char text[32] = {0};
        bool modified = false;
    };
    std::map<int, FieldEdit> edits;

    bool hasUnsavedChanges = false;
    std::string statusMessage;
    EditorMessage pendingMessage;

    void clear() {
        save.close();
        properties.clear();
        table.clear();
        unlocked.clear();
        fileLoaded = false;
        loadPath.clear();
        savePathInput[0] = '\0';
        saveTarget.clear();
        savePathTruncated = false;
        selectedCharacter = 0;
        edits.clear();
        hasUnsavedChanges = false;
    }
};

bool openSaveFile(SaveEditorState& state, const std::string& path);
void selectCharacter(SaveEditorState& state, int character);
const CharacterField* findCharacterField(const SaveEditorState& state, int keyword);

void setSaveTarget(SaveEditorState& state, const std::string& path);
std::string saveTargetPath(const SaveEditorState& state);

void markFieldEdited(SaveEditorState& state, int keyword);
std::string fieldLabel(const SaveEditorState& state, int keyword);

bool parseFieldValue(const std::string& text, uint32_t& out);
bool applyFieldEdit(SaveEditorState& state, int keyword, const std::string& text);

bool writeSaveFile(SaveEditorState& state, const std::string& path);
bool restoreSaveBackup(SaveEditorState& state);
bool canRestoreBackup(const SaveEditorState& state);

void postEditorMessage(SaveEditorState& state, EditorMessageKind kind,
                       const std::string& title, const std::string& text);
