#pragma once

#include <algorithm>
#include <string_view>
#include <utility>

#include "imgui.h"
#include "imgui_internal.h"

// Unlike ImGui::Text, this takes the string as it is (no formatting).
inline void imgui_Str(std::string_view str) { ImGui::TextUnformatted(str.data(), str.data() + str.size()); }

inline void imgui_StrDisabled(std::string_view str) {
    ImGui::PushStyleColor(ImGuiCol_Text, ImGui::GetStyleColorVec4(ImGuiCol_TextDisabled));
    imgui_Str(str);
    ImGui::PopStyleColor();
}

// Disabled `str` that shows `desc` when hovered; like `HelpMarker` in "imgui_demo.cpp".
inline void imgui_StrTooltip(std::string_view str, std::string_view desc) {
    imgui_StrDisabled(str);
    if (ImGui::BeginItemTooltip()) {
        ImGui::PushTextWrapPos(ImGui::GetFontSize() * 35.0f);
        imgui_Str(desc);
        ImGui::PopTextWrapPos();
        ImGui::EndTooltip();
    }
}

// Calls `end` when leaving the scope, whether or not the window is visible.
template <void (*end)()>
class [[nodiscard]] imgui_Scope {
    bool m_visible;

public:
    explicit imgui_Scope(bool visible) : m_visible(visible) {}
    imgui_Scope(const imgui_Scope&) = delete;
    imgui_Scope& operator=(const imgui_Scope&) = delete;
    ~imgui_Scope() { end(); }

    explicit operator bool() const { return m_visible; }
};

inline imgui_Scope<ImGui::End> imgui_Window(const char* name, ImGuiWindowFlags flags) {
    return imgui_Scope<ImGui::End>(ImGui::Begin(name, nullptr, flags));
}

inline imgui_Scope<ImGui::EndChild> imgui_ChildWindow(const char* name, ImGuiChildFlags child_flags = {},
                                                      ImGuiWindowFlags window_flags = {}) {
    return imgui_Scope<ImGui::EndChild>(ImGui::BeginChild(name, {}, child_flags, window_flags));
}

// A slider with "-" and "+" buttons (holding them repeats); the value moves in multiples of `step` from `v_min`.
inline bool imgui_StepSliderInt(const char* label, int* v, int v_min, int v_max, int step = 1,
                                const char* format = "%d") {
    const float button = ImGui::GetFrameHeight();
    const float spacing = ImGui::GetStyle().ItemInnerSpacing.x;

    int n = (*v - v_min) / step;
    const int n_max = (v_max - v_min) / step;

    ImGui::PushID(label);
    ImGui::BeginGroup();
    ImGui::SetNextItemWidth(std::max(1.0f, ImGui::CalcItemWidth() - 2 * (button + spacing)));
    int shown = v_min + n * step;
    if (ImGui::SliderInt("##slider", &shown, v_min, v_max, format, ImGuiSliderFlags_NoInput)) {
        n = (shown - v_min + step / 2) / step;
    }
    ImGui::PushItemFlag(ImGuiItemFlags_ButtonRepeat, true);
    ImGui::SameLine(0, spacing);
    if (ImGui::Button("-", ImVec2(button, button))) {
        --n;
    }
    ImGui::SameLine(0, spacing);
    if (ImGui::Button("+", ImVec2(button, button))) {
        ++n;
    }
    ImGui::PopItemFlag();
    ImGui::SameLine(0, spacing);
    imgui_Str(std::string_view(label, ImGui::FindRenderedTextEnd(label)));
    ImGui::EndGroup();
    ImGui::PopID();

    const int next = v_min + std::clamp(n, 0, n_max) * step;
    return std::exchange(*v, next) != next;
}
