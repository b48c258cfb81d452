#include "ui/rotation_controls.h"

#include "rotation/config_store.h"
#include "rotation/rotation_engine.h"
#include "rotation/transition_coordinator.h"

#include "imgui.h"

#include <cstdio>

namespace drift::ui
{
namespace
{
static void ShadowedText(const char* text, float shadow_alpha)
{
    ImDrawList* dl = ImGui::GetWindowDrawList();
    const ImVec2 pos = ImGui::GetCursorScreenPos();
    if (shadow_alpha > 0.0f)
        dl->AddText(ImVec2(pos.x + 1.0f, pos.y + 1.0f), IM_COL32(0, 0, 0, (int)(shadow_alpha * 255.0f)), text);
    ImGui::TextUnformatted(text);
}
} // namespace

const char* IntervalLabel(unsigned seconds)
{
    switch (seconds)
    {
        case 0: return "Off";
        case 15: return "15 s";
        case 30: return "30 s";
        case 60: return "1 min";
        case 300: return "5 min";
        case 900: return "15 min";
        case 1800: return "30 min";
        case 3600: return "1 h";
        default: return "Custom";
    }
}

void RenderRotationControls(RotationEngine& engine, float text_shadow_alpha, bool* open)
{
    if (open && !*open)
        return;

    const ImGuiViewport* vp = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x + vp->WorkSize.x - 16.0f, vp->WorkPos.y + 16.0f),
                            ImGuiCond_FirstUseEver, ImVec2(1.0f, 0.0f));

    const ImGuiWindowFlags flags = ImGuiWindowFlags_AlwaysAutoResize |
                                   ImGuiWindowFlags_NoSavedSettings |
                                   ImGuiWindowFlags_NoFocusOnAppearing;
    if (!ImGui::Begin("Backdrop", open, flags))
    {
        ImGui::End();
        return;
    }

    const TransitionCoordinator* coordinator = engine.Coordinator();
    const bool switching = coordinator && coordinator->Switching();

    if (ImGui::Button("Next image"))
        engine.RequestSwap();
    ImGui::SameLine();
    ImGui::TextDisabled(switching ? "switching..." : "N / Right");

    const unsigned interval = engine.GetInterval();
    if (ImGui::BeginCombo("Interval", IntervalLabel(interval)))
    {
        for (unsigned choice : ConfigStore::IntervalChoices())
        {
            const bool selected = choice == interval;
            if (ImGui::Selectable(IntervalLabel(choice), selected))
                engine.SetInterval(choice);
            if (selected)
                ImGui::SetItemDefaultFocus();
        }
        ImGui::EndCombo();
    }

    const unsigned blur = engine.GetBlur();
    const int max_blur = engine.Hint().max_blur_px;
    char blur_label[32];
    std::snprintf(blur_label, sizeof(blur_label), "%u px", blur);
    if (ImGui::BeginCombo("Blur", blur_label))
    {
        for (unsigned choice : ConfigStore::BlurChoices())
        {
            // Choices above the device maximum would only clamp.
            if ((int)choice > max_blur)
                continue;
            char label[32];
            std::snprintf(label, sizeof(label), "%u px", choice);
            const bool selected = choice == blur;
            if (ImGui::Selectable(label, selected))
                engine.SetBlur(choice);
            if (selected)
                ImGui::SetItemDefaultFocus();
        }
        ImGui::EndCombo();
    }

    const char* tone = engine.Outputs().ToneAttribute();
    char status[96];
    std::snprintf(status, sizeof(status), "tone: %s", (tone && *tone) ? tone : "-");
    ShadowedText(status, text_shadow_alpha);

    ImGui::End();
}
} // namespace drift::ui
