#ifdef LECTERN_USE_IMGUI

    #include "cockpit_panel.hpp"

    #include <algorithm>
    #include <cstdio>
    #include <cstring>
    #include <imgui.h>
    #include <lectern/logger.hpp>

    #include "../cockpit/cockpit.hpp"
    #include "../cockpit/note_target.hpp"

namespace lectern
{

static constexpr float TOP_BAR_HEIGHT   = 72.0f;
static constexpr float SIDE_PANEL_WIDTH = 360.0f;
static constexpr float PANE_GAP         = 6.0f;

// std::string-backed InputText buffer growth.
static int string_resize_callback(ImGuiInputTextCallbackData* data)
{
    if (data->EventFlag == ImGuiInputTextFlags_CallbackResize)
    {
        auto* str = static_cast<std::string*>(data->UserData);
        str->resize(static_cast<size_t>(data->BufTextLen));
        data->Buf = str->data();
    }
    return 0;
}

CockpitPanel::CockpitPanel(Cockpit& cockpit) : cockpit_(cockpit) {}

void CockpitPanel::draw(FrameTime now, float pixels_per_logical)
{
    ImGuiIO&        io = ImGui::GetIO();
    ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove
                             | ImGuiWindowFlags_NoSavedSettings
                             | ImGuiWindowFlags_NoBringToFrontOnFocus;

    ImGui::SetNextWindowPos(ImVec2(0.0f, 0.0f));
    ImGui::SetNextWindowSize(io.DisplaySize);
    ImGui::Begin("##cockpit", nullptr, flags);

    if (!cockpit_.is_open())
    {
        draw_closed();
        ImGui::End();
        return;
    }

    draw_top_bar(now);
    if (!cockpit_.is_open())
    {
        ImGui::End();
        return;
    }
    draw_panes(pixels_per_logical > 0.0f ? pixels_per_logical : 1.0f);
    ImGui::SameLine();
    draw_side_panel(now);

    ImGui::End();

    draw_notifications();
}

// ─── Top bar ────────────────────────────────────────────────────────────────

void CockpitPanel::sync_url_buffer()
{
    const auto&  state  = cockpit_.state();
    const size_t active = state.active_pane;
    const auto&  url    = state.panes[active].current_url;
    if (active == url_synced_pane_ && url == url_synced_value_)
        return;
    url_synced_pane_  = active;
    url_synced_value_ = url;
    std::snprintf(url_buf_.data(), url_buf_.size(), "%s", url.c_str());
}

void CockpitPanel::draw_top_bar(FrameTime now)
{
    ImGui::BeginChild("##top_bar", ImVec2(0.0f, TOP_BAR_HEIGHT), false);

    const auto& state = cockpit_.state();
    ImGui::TextUnformatted(state.context.title ? state.context.title->c_str() : "Research");
    ImGui::SameLine();
    ImGui::TextDisabled("%s", describe_note_target(state.note_target).c_str());

    const size_t count = state.pane_count;
    if (ImGui::Button("-"))
        cockpit_.set_pane_count(count > 1 ? count - 1 : 1);
    ImGui::SameLine();
    for (size_t n = 1; n <= MAX_PANES; ++n)
    {
        char label[16];
        std::snprintf(label, sizeof(label), "%zu", n);
        if (n > 1)
            ImGui::SameLine();
        if (ImGui::RadioButton(label, count == n))
            cockpit_.set_pane_count(n);
    }
    ImGui::SameLine();
    if (ImGui::Button("+"))
        cockpit_.set_pane_count(count + 1);

    ImGui::SameLine();
    if (ImGui::Button("<"))
        cockpit_.go_back();
    ImGui::SameLine();
    if (ImGui::Button(">"))
        cockpit_.go_forward();
    ImGui::SameLine();
    if (ImGui::Button("Reload"))
        cockpit_.reload();

    ImGui::SameLine();
    if (!url_editing_)
        sync_url_buffer();
    ImGui::SetNextItemWidth(ImGui::GetContentRegionAvail().x - 120.0f);
    bool submit = ImGui::InputTextWithHint("##url",
                                           "Enter a URL",
                                           url_buf_.data(),
                                           url_buf_.size(),
                                           ImGuiInputTextFlags_EnterReturnsTrue);
    url_editing_ = ImGui::IsItemActive();
    ImGui::SameLine();
    submit |= ImGui::Button("Go");
    if (submit)
    {
        cockpit_.submit_url(url_buf_.data(), now);
        url_synced_pane_ = static_cast<size_t>(-1);
    }

    ImGui::SameLine();
    if (ImGui::Button("Close"))
        cockpit_.close();

    ImGui::EndChild();
}

// ─── Pane hosts ─────────────────────────────────────────────────────────────

void CockpitPanel::draw_panes(float pixels_per_logical)
{
    const auto&  state = cockpit_.state();
    const size_t count = state.pane_count;
    ImVec2       avail = ImGui::GetContentRegionAvail();
    const float  area_w = std::max(0.0f, avail.x - SIDE_PANEL_WIDTH - PANE_GAP);
    const float  pane_w = std::max(0.0f, (area_w - PANE_GAP * static_cast<float>(count - 1))
                                            / static_cast<float>(count));

    ImGui::BeginGroup();
    for (size_t i = 0; i < count; ++i)
    {
        const Pane& pane = state.panes[i];
        if (i > 0)
            ImGui::SameLine(0.0f, PANE_GAP);

        ImGui::PushID(static_cast<int>(i));
        ImGui::BeginGroup();

        const bool  active = i == state.active_pane;
        std::string header = pane.title.empty() ? pane.label : pane.title;
        if (ImGui::Selectable(header.c_str(), active, 0, ImVec2(pane_w, 0.0f)))
            cockpit_.select_pane(i);

        // Body: an empty child the surface window covers.
        ImVec2 body_size(pane_w, std::max(0.0f, avail.y - ImGui::GetFrameHeightWithSpacing()));
        ImGui::BeginChild("##pane_body", body_size, true);
        ImVec2 origin = ImGui::GetWindowPos();
        ImVec2 size   = ImGui::GetWindowSize();
        const SurfaceState surface = cockpit_.lifecycle().state(pane.label);
        if (surface != SurfaceState::Created)
            ImGui::TextDisabled("%s", surface_state_name(surface));
        ImGui::EndChild();

        cockpit_.layout().update(pane.label,
                                 HostRect{origin.x / pixels_per_logical,
                                          origin.y / pixels_per_logical,
                                          size.x / pixels_per_logical,
                                          size.y / pixels_per_logical});

        ImGui::EndGroup();
        ImGui::PopID();
    }
    ImGui::EndGroup();
}

// ─── Side panel ─────────────────────────────────────────────────────────────

void CockpitPanel::sync_note_buffer()
{
    if (note_editing_)
        return;
    const std::string& text = cockpit_.draft().text();
    if (note_buf_ != text)
        note_buf_ = text;
}

void CockpitPanel::sync_selection_buffer()
{
    if (selection_editing_)
        return;
    const std::string& text = cockpit_.state().selection.text;
    if (selection_buf_ != text)
        selection_buf_ = text;
}

void CockpitPanel::draw_side_panel(FrameTime now)
{
    const auto& state = cockpit_.state();

    ImGui::BeginChild("##side_panel", ImVec2(0.0f, 0.0f), true);

    ImGui::TextUnformatted("Selection");
    sync_selection_buffer();
    const bool selection_changed = ImGui::InputTextMultiline("##selection",
                                                             selection_buf_.data(),
                                                             selection_buf_.capacity() + 1,
                                                             ImVec2(-1.0f, 120.0f),
                                                             ImGuiInputTextFlags_CallbackResize,
                                                             string_resize_callback,
                                                             &selection_buf_);
    selection_editing_ = ImGui::IsItemActive();
    if (selection_changed)
        cockpit_.set_selection_text(selection_buf_);
    if (!state.selection.source_title.empty() || !state.selection.source_url.empty())
    {
        ImGui::TextDisabled("%s",
                            state.selection.source_title.empty()
                                ? state.selection.source_url.c_str()
                                : state.selection.source_title.c_str());
    }

    if (ImGui::Button("Paste"))
        cockpit_.paste_selection(now);
    ImGui::SameLine();
    const bool can_add = cockpit_.can_add_to_notes();
    ImGui::BeginDisabled(!can_add);
    if (ImGui::Button("Add to notes"))
        cockpit_.add_selection_to_notes(now);
    ImGui::EndDisabled();

    if (cockpit_.active_bridge_capability() != BridgeCapability::Available)
    {
        ImGui::TextWrapped(
            "Live selection is unavailable for this pane. Copy text in the page, then press Paste.");
    }

    ImGui::Separator();

    NoteDraft& draft = cockpit_.draft();
    if (draft.bound())
    {
        ImGui::Text("Notes  (%s)", draft_status_name(draft.status()));
        if (draft.status() == DraftStatus::Error)
            ImGui::TextColored(ImVec4(0.9f, 0.4f, 0.4f, 1.0f), "%s", draft.error().c_str());

        // Until the stored note is loaded the editor must not produce a body
        // that would replace it.
        ImGuiInputTextFlags flags = ImGuiInputTextFlags_CallbackResize;
        if (!draft.loaded())
        {
            if (ImGui::Button("Retry loading note"))
                cockpit_.reload_note(now);
            flags |= ImGuiInputTextFlags_ReadOnly;
        }

        sync_note_buffer();
        const bool changed = ImGui::InputTextMultiline("##note",
                                                       note_buf_.data(),
                                                       note_buf_.capacity() + 1,
                                                       ImVec2(-1.0f, -1.0f),
                                                       flags,
                                                       string_resize_callback,
                                                       &note_buf_);
        note_editing_ = ImGui::IsItemActive() && draft.loaded();
        if (changed && draft.loaded())
            draft.edit(note_buf_, now);
    }
    else
    {
        ImGui::TextDisabled("No note is attached to this session.");
    }

    ImGui::EndChild();
}

// ─── Notifications ──────────────────────────────────────────────────────────

void CockpitPanel::draw_notifications()
{
    auto& queue = cockpit_.notifications();
    if (queue.empty())
        return;

    ImGuiIO& io = ImGui::GetIO();
    ImVec2   pos(io.DisplaySize.x - 16.0f, io.DisplaySize.y - 16.0f);
    ImGui::SetNextWindowPos(pos, ImGuiCond_Always, ImVec2(1.0f, 1.0f));
    ImGui::SetNextWindowBgAlpha(0.9f);
    ImGui::Begin("##toasts",
                 nullptr,
                 ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize
                     | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoFocusOnAppearing
                     | ImGuiWindowFlags_NoNav);

    uint64_t dismissed = 0;
    for (const auto& n : queue.items())
    {
        ImVec4 color(0.85f, 0.85f, 0.85f, 1.0f);
        if (n.kind == NotificationKind::Success)
            color = ImVec4(0.45f, 0.85f, 0.5f, 1.0f);
        else if (n.kind == NotificationKind::Error)
            color = ImVec4(0.95f, 0.45f, 0.45f, 1.0f);

        ImGui::PushID(static_cast<int>(n.id));
        ImGui::TextColored(color, "%s", n.message.c_str());
        ImGui::SameLine();
        if (ImGui::SmallButton("x"))
            dismissed = n.id;
        ImGui::PopID();
    }
    ImGui::End();

    if (dismissed != 0)
        queue.dismiss(dismissed);
}

void CockpitPanel::draw_closed()
{
    ImVec2 avail = ImGui::GetContentRegionAvail();
    ImGui::SetCursorPos(ImVec2(avail.x * 0.5f - 80.0f, avail.y * 0.5f - 20.0f));
    ImGui::BeginGroup();
    ImGui::TextDisabled("The cockpit is closed.");
    if (ImGui::Button("Open cockpit", ImVec2(160.0f, 0.0f)))
        reopen_requested_ = true;
    ImGui::EndGroup();
}

}   // namespace lectern

#endif   // LECTERN_USE_IMGUI
