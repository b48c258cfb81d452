#include "ui/skin.h"

#include "imgui.h"

#include <cstring>

namespace drift::ui
{
namespace
{
static void SetupStyle_Common(ImGuiStyle& style)
{
    style.Alpha = 1.0f;
    style.DisabledAlpha = 0.5f;
    style.WindowPadding = ImVec2(12.0f, 10.0f);
    style.WindowRounding = 8.0f;
    style.WindowBorderSize = 0.0f;
    style.WindowMinSize = ImVec2(32.0f, 32.0f);
    style.WindowTitleAlign = ImVec2(0.0f, 0.5f);
    style.WindowMenuButtonPosition = ImGuiDir_None;
    style.PopupRounding = 6.0f;
    style.PopupBorderSize = 0.0f;
    style.FramePadding = ImVec2(8.0f, 4.0f);
    style.FrameRounding = 4.0f;
    style.FrameBorderSize = 0.0f;
    style.ItemSpacing = ImVec2(8.0f, 6.0f);
    style.ItemInnerSpacing = ImVec2(6.0f, 4.0f);
    style.GrabRounding = 4.0f;
    style.ButtonTextAlign = ImVec2(0.5f, 0.5f);
}

// Light panel over bright photos.
static void SetupStyle_Light(ImGuiStyle& style)
{
    ImGui::StyleColorsLight(&style);
    style.Colors[ImGuiCol_Text] = ImVec4(0.08f, 0.09f, 0.11f, 1.00f);
    style.Colors[ImGuiCol_TextDisabled] = ImVec4(0.08f, 0.09f, 0.11f, 0.45f);
    style.Colors[ImGuiCol_WindowBg] = ImVec4(0.97f, 0.97f, 0.96f, 1.00f);
    style.Colors[ImGuiCol_PopupBg] = ImVec4(0.98f, 0.98f, 0.97f, 0.96f);
    style.Colors[ImGuiCol_FrameBg] = ImVec4(0.86f, 0.86f, 0.84f, 0.80f);
    style.Colors[ImGuiCol_FrameBgHovered] = ImVec4(0.78f, 0.80f, 0.84f, 0.90f);
    style.Colors[ImGuiCol_Button] = ImVec4(0.18f, 0.22f, 0.30f, 0.12f);
    style.Colors[ImGuiCol_ButtonHovered] = ImVec4(0.18f, 0.22f, 0.30f, 0.24f);
    style.Colors[ImGuiCol_ButtonActive] = ImVec4(0.18f, 0.22f, 0.30f, 0.36f);
}

// Dark panel over dim photos.
static void SetupStyle_Dark(ImGuiStyle& style)
{
    ImGui::StyleColorsDark(&style);
    style.Colors[ImGuiCol_Text] = ImVec4(0.94f, 0.95f, 0.96f, 1.00f);
    style.Colors[ImGuiCol_TextDisabled] = ImVec4(0.94f, 0.95f, 0.96f, 0.40f);
    style.Colors[ImGuiCol_WindowBg] = ImVec4(0.07f, 0.08f, 0.10f, 1.00f);
    style.Colors[ImGuiCol_PopupBg] = ImVec4(0.10f, 0.11f, 0.13f, 0.96f);
    style.Colors[ImGuiCol_FrameBg] = ImVec4(0.20f, 0.22f, 0.26f, 0.70f);
    style.Colors[ImGuiCol_FrameBgHovered] = ImVec4(0.28f, 0.31f, 0.37f, 0.80f);
    style.Colors[ImGuiCol_Button] = ImVec4(1.00f, 1.00f, 1.00f, 0.10f);
    style.Colors[ImGuiCol_ButtonHovered] = ImVec4(1.00f, 1.00f, 1.00f, 0.20f);
    style.Colors[ImGuiCol_ButtonActive] = ImVec4(1.00f, 1.00f, 1.00f, 0.30f);
}
} // namespace

const char* ThemeIdForTone(const char* tone_attribute)
{
    if (tone_attribute && std::strcmp(tone_attribute, kThemeLight) == 0)
        return kThemeLight;
    return kThemeDark;
}

void ApplyBackdropTheme(const char* tone_attribute, const OverlayTokens& tokens, float ui_scale)
{
    // Reset to a clean base so switching themes doesn't leak old values.
    ImGuiStyle& style = ImGui::GetStyle();
    style = ImGuiStyle();

    SetupStyle_Common(style);
    if (std::strcmp(ThemeIdForTone(tone_attribute), kThemeLight) == 0)
        SetupStyle_Light(style);
    else
        SetupStyle_Dark(style);

    style.Colors[ImGuiCol_WindowBg].w = tokens.panel_alpha;

    if (ui_scale <= 0.0f)
        ui_scale = 1.0f;
    style.ScaleAllSizes(ui_scale);
    style.FontScaleDpi = ui_scale;
}
} // namespace drift::ui
