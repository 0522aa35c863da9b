#pragma once
#include "ui.h"
#include "types.h"
#include "settings.h"
#include "save_editor.h"
#include "roster.h"
#include <GLFW/glfw3.h>
#include "imgui.h"
#include "ImGuiFileDialog.h"
#include <string>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

// Editor panels (ui_editor.cpp)
void drawFileRows(AppState& state);
void drawCharacterFields(AppState& state);
void drawEditorMessage(AppState& state);

// File dialogs (ui_main.cpp)
void openLoadDialog(AppState& state);
void openSaveDialog(AppState& state);
