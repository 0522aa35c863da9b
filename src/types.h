#pragma once
#include <string>
#include "save_editor.h"

struct AppState {
    SaveEditorState editor;
    std::string lastDialogPath;
    std::string lastSavePath;
    int windowWidth = 640;
    int windowHeight = 480;
    bool showAbout = false;
    bool requestRestoreConfirm = false;
};
