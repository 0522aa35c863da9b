#include "settings.h"
#include "types.h"
#include <fstream>
#include <iostream>
#include <stdexcept>

static bool parseDimension(const std::string& val, int& out) {
    try {
        size_t consumed = 0;
        int v = std::stoi(val, &consumed);
        if (consumed != val.size() || v < 200 || v > 16384) return false;
        out = v;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

void saveSettings(const AppState& state, const std::string& path) {
    std::ofstream f(path);
    if (f.is_open()) {
        f << "lastDialogPath=" << state.lastDialogPath << "\n";
        f << "lastSavePath=" << state.lastSavePath << "\n";
        f << "backupDir=" << state.editor.backupDir << "\n";
        f << "windowWidth=" << state.windowWidth << "\n";
        f << "windowHeight=" << state.windowHeight << "\n";
    } else {
        std::cout << "[CFG] Cannot write " << path << std::endl;
    }
}

void loadSettings(AppState& state, const std::string& path) {
    std::ifstream f(path);
    if (f.is_open()) {
        std::string line;
        while (std::getline(f, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            size_t eq = line.find('=');
            if (eq != std::string::npos) {
                std::string key = line.substr(0, eq);
                std::string val = line.substr(eq + 1);
                if (key == "lastDialogPath") state.lastDialogPath = val;
                else if (key == "lastSavePath") state.lastSavePath = val;
                else if (key == "backupDir") { if (!val.empty()) state.editor.backupDir = val; }
                else if (key == "windowWidth") {
                    if (!parseDimension(val, state.windowWidth))
                        std::cout << "[CFG] Ignoring windowWidth=" << val << std::endl;
                }
                else if (key == "windowHeight") {
                    if (!parseDimension(val, state.windowHeight))
                        std::cout << "[CFG] Ignoring windowHeight=" << val << std::endl;
                }
            }
        }
    }
}
