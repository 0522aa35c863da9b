#pragma once
#include <string>

struct AppState;

constexpr const char* SETTINGS_FILE = "subverse_save_editor.ini";

void saveSettings(const AppState& state, const std::string& path = SETTINGS_FILE);
void loadSettings(AppState& state, const std::string& path = SETTINGS_FILE);
