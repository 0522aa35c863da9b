#include "ui_internal.h"

static bool s_messageOpen = false;

void drawFileRows(AppState& state) {
    SaveEditorState& ed = state.editor;

    if (ImGui::BeginTable("##FileRows", 3, ImGuiTableFlags_SizingStretchProp)) {
        ImGui::TableSetupColumn("Label", ImGuiTableColumnFlags_WidthFixed, 110.0f);
        ImGui::TableSetupColumn("Path", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableSetupColumn("Action", ImGuiTableColumnFlags_WidthFixed, 110.0f);

        ImGui::TableNextRow();
        ImGui::TableNextColumn();
        ImGui::AlignTextToFramePadding();
        ImGui::Text("Load .sav file");
        ImGui::TableNextColumn();
        ImGui::AlignTextToFramePadding();
        if (ed.loadPath.empty()) {
            ImGui::TextDisabled("(none)");
        } else {
            ImGui::TextUnformatted(ed.loadPath.c_str());
            if (ImGui::IsItemHovered()) ImGui::SetTooltip("%s", ed.loadPath.c_str());
        }
        ImGui::TableNextColumn();
        if (ImGui::Button("Browse", ImVec2(-1, 0))) openLoadDialog(state);

        ImGui::TableNextRow();
        ImGui::TableNextColumn();
        ImGui::AlignTextToFramePadding();
        ImGui::Text("Save as");
        ImGui::TableNextColumn();
        ImGui::SetNextItemWidth(-1);
        ImGui::InputText("##SavePath", ed.savePathInput, sizeof(ed.savePathInput));
        if (ed.savePathTruncated && ImGui::IsItemHovered())
            ImGui::SetTooltip("%s", saveTargetPath(ed).c_str());
        ImGui::TableNextColumn();
        ImGui::BeginDisabled(!ed.fileLoaded);
        if (ImGui::Button("Apply & Save", ImVec2(-1, 0))) openSaveDialog(state);
        ImGui::EndDisabled();

        ImGui::EndTable();
    }
}

void drawCharacterFields(AppState& state) {
    SaveEditorState& ed = state.editor;

    ImGui::BeginChild("Properties", ImVec2(0, -ImGui::GetFrameHeightWithSpacing()), true);
    if (!ed.fileLoaded) {
        ImGui::TextDisabled("No save file loaded");
        ImGui::EndChild();
        return;
    }

    bool selUnlocked = ed.selectedCharacter < (int)ed.unlocked.size() && ed.unlocked[ed.selectedCharacter];
    std::string preview = characterDisplayName(ed.selectedCharacter, selUnlocked);
    ImGui::SetNextItemWidth(240.0f);
    if (ImGui::BeginCombo("Character", preview.c_str())) {
        for (int c = 0; c < ROSTER_CHARACTER_COUNT; c++) {
            bool unlocked = c < (int)ed.unlocked.size() && ed.unlocked[c];
            std::string name = characterDisplayName(c, unlocked);
            bool selected = (c == ed.selectedCharacter);
            if (!unlocked) ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(0.6f, 0.6f, 0.6f, 1.0f));
            if (ImGui::Selectable(name.c_str(), selected)) selectCharacter(ed, c);
            if (!unlocked) ImGui::PopStyleColor();
            if (selected) ImGui::SetItemDefaultFocus();
        }
        ImGui::EndCombo();
    }
    ImGui::Separator();

    if (ImGui::BeginTable("##Fields", 3, ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersInnerV)) {
        ImGui::TableSetupColumn("Field", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableSetupColumn("Value", ImGuiTableColumnFlags_WidthFixed, 160.0f);
        ImGui::TableSetupColumn("##Apply", ImGuiTableColumnFlags_WidthFixed, 70.0f);

        for (int k = 0; k < ROSTER_KEYWORD_COUNT; k++) {
            const CharacterField* field = findCharacterField(ed, k);
            if (!field) continue;
            auto& edit = ed.edits[k];

            ImGui::PushID(k);
            ImGui::TableNextRow();
            ImGui::TableNextColumn();
            ImGui::AlignTextToFramePadding();
            std::string label = fieldLabel(ed, k);
            if (edit.modified)
                ImGui::TextColored(ImVec4(1.0f, 0.8f, 0.4f, 1.0f), "%s", label.c_str());
            else
                ImGui::Text("%s", label.c_str());
            if (ImGui::IsItemHovered())
                ImGui::SetTooltip("%s @ 0x%zX", field->prop.name.c_str(), field->prop.offset);

            ImGui::TableNextColumn();
            ImGui::SetNextItemWidth(-1);
            if (ImGui::InputText("##Value", edit.text, sizeof(edit.text)))
                markFieldEdited(ed, k);

            ImGui::TableNextColumn();
            if (ImGui::Button("Apply", ImVec2(-1, 0)))
                applyFieldEdit(ed, k, edit.text);
            ImGui::PopID();
        }
        ImGui::EndTable();
    }

    if (ed.table.empty() || ed.table[ed.selectedCharacter].empty())
        ImGui::TextDisabled("No fields found for this character");
    ImGui::EndChild();
}

void drawEditorMessage(AppState& state) {
    EditorMessage& msg = state.editor.pendingMessage;
    if (msg.kind != EditorMessageKind::None && !s_messageOpen) {
        ImGui::OpenPopup("###EditorMessage");
        s_messageOpen = true;
    }

    std::string title = msg.title.empty() ? "Message" : msg.title;
    title += "###EditorMessage";
    if (ImGui::BeginPopupModal(title.c_str(), nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImVec4 color(1.0f, 1.0f, 1.0f, 1.0f);
        if (msg.kind == EditorMessageKind::Error) color = ImVec4(1.0f, 0.3f, 0.3f, 1.0f);
        else if (msg.kind == EditorMessageKind::Warning) color = ImVec4(1.0f, 0.8f, 0.3f, 1.0f);
        ImGui::TextColored(color, "%s", msg.text.c_str());
        ImGui::Spacing();
        ImGui::Separator();
        if (ImGui::Button("OK", ImVec2(100, 0)) || ImGui::IsKeyPressed(ImGuiKey_Enter)) {
            msg = EditorMessage{};
            s_messageOpen = false;
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    } else if (s_messageOpen) {
        msg = EditorMessage{};
        s_messageOpen = false;
    }
}
