#include "ui_internal.h"

static const char* APP_TITLE = "Subverse Save Editor";
static const char* CURRENT_APP_VERSION = "1.0";

static std::string dialogDirFor(const AppState& state, const std::string& path) {
    if (!path.empty()) {
        fs::path parent = fs::path(path).parent_path();
        std::error_code ec;
        if (!parent.empty() && fs::is_directory(parent, ec)) return parent.string();
    }
    return state.lastDialogPath.empty() ? "." : state.lastDialogPath;
}

void openLoadDialog(AppState& state) {
    IGFD::FileDialogConfig config;
    config.path = dialogDirFor(state, state.lastSavePath);
    ImGuiFileDialog::Instance()->OpenDialog("OpenSav", "Open Save File", ".sav", config);
}

void openSaveDialog(AppState& state) {
    std::string target = saveTargetPath(state.editor);
    IGFD::FileDialogConfig config;
    config.path = dialogDirFor(state, target);
    config.fileName = target.empty() ? std::string() : fs::path(target).filename().string();
    config.flags = ImGuiFileDialogFlags_ConfirmOverwrite;
    ImGuiFileDialog::Instance()->OpenDialog("SaveSav", "Save File As", ".sav", config);
}

static void handleFileDialogs(AppState& state) {
    if (ImGuiFileDialog::Instance()->Display("OpenSav", ImGuiWindowFlags_NoCollapse, ImVec2(600, 400))) {
        if (ImGuiFileDialog::Instance()->IsOk()) {
            std::string path = ImGuiFileDialog::Instance()->GetFilePathName();
            state.lastDialogPath = ImGuiFileDialog::Instance()->GetCurrentPath();
            if (openSaveFile(state.editor, path)) {
                state.lastSavePath = path;
            }
            saveSettings(state);
        }
        ImGuiFileDialog::Instance()->Close();
    }

    if (ImGuiFileDialog::Instance()->Display("SaveSav", ImGuiWindowFlags_NoCollapse, ImVec2(600, 400))) {
        if (ImGuiFileDialog::Instance()->IsOk()) {
            std::string path = ImGuiFileDialog::Instance()->GetFilePathName();
            state.lastDialogPath = ImGuiFileDialog::Instance()->GetCurrentPath();
            writeSaveFile(state.editor, path);
            saveSettings(state);
        }
        ImGuiFileDialog::Instance()->Close();
    }
}

static void drawRestoreConfirm(AppState& state) {
    if (state.requestRestoreConfirm) {
        ImGui::OpenPopup("Restore Backup?");
        state.requestRestoreConfirm = false;
    }
    if (ImGui::BeginPopupModal("Restore Backup?", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::TextColored(ImVec4(1.0f, 0.5f, 0.0f, 1.0f), "Warning!");
        ImGui::Text("This will overwrite %s with its backup.", state.editor.loadPath.c_str());
        ImGui::Text("Applied changes that were not saved elsewhere are lost.");
        ImGui::Separator();
        if (ImGui::Button("Restore", ImVec2(100, 0))) {
            restoreSaveBackup(state.editor);
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(100, 0))) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

static void drawAboutWindow(AppState& state) {
    if (!state.showAbout) return;
    ImGui::SetNextWindowSize(ImVec2(360, 0), ImGuiCond_Appearing);
    if (ImGui::Begin("About", &state.showAbout, ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("%s %s", APP_TITLE, CURRENT_APP_VERSION);
        ImGui::Separator();
        ImGui::TextWrapped("Edits per-character integer fields (level, XP, points, devotion) "
                           "inside Subverse GVAS save files.");
        ImGui::Spacing();
        ImGui::TextDisabled("Backups: %s", state.editor.backupDir.c_str());
    }
    ImGui::End();
}

static void drawMenuBar(AppState& state) {
    if (!ImGui::BeginMenuBar()) return;
    if (ImGui::BeginMenu("File")) {
        if (ImGui::MenuItem("Open...")) openLoadDialog(state);
        if (ImGui::MenuItem("Save As...", nullptr, false, state.editor.fileLoaded)) openSaveDialog(state);
        ImGui::Separator();
        if (ImGui::MenuItem("Restore Backup", nullptr, false, canRestoreBackup(state.editor)))
            state.requestRestoreConfirm = true;
        ImGui::EndMenu();
    }
    if (ImGui::BeginMenu("Help")) {
        if (ImGui::MenuItem("About")) state.showAbout = true;
        ImGui::EndMenu();
    }
    ImGui::EndMenuBar();
}

void drawUI(AppState& state, GLFWwindow* window, ImGuiIO& io) {
    static std::string s_lastTitle;
    std::string title = APP_TITLE;
    if (state.editor.hasUnsavedChanges) title += " *";
    if (title != s_lastTitle) {
        glfwSetWindowTitle(window, title.c_str());
        s_lastTitle = title;
    }

    ImGui::SetNextWindowPos(ImVec2(0, 0));
    ImGui::SetNextWindowSize(io.DisplaySize);
    ImGui::Begin("Main", nullptr, ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize |
                 ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_MenuBar);

    drawMenuBar(state);
    drawFileRows(state);
    ImGui::Spacing();
    drawCharacterFields(state);

    if (!state.editor.statusMessage.empty())
        ImGui::TextDisabled("%s", state.editor.statusMessage.c_str());
    else
        ImGui::TextDisabled("Ready");

    drawRestoreConfirm(state);
    drawEditorMessage(state);
    ImGui::End();

    drawAboutWindow(state);
    handleFileDialogs(state);
}
