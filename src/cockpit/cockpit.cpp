#include "cockpit.hpp"

#include <lectern/logger.hpp>

#include "../core/url.hpp"
#include "note_target.hpp"

namespace lectern
{

static SelectionBridgeOptions bridge_options(const CockpitConfig& config)
{
    SelectionBridgeOptions o;
    o.channel     = config.selection_channel;
    o.host_label  = config.host_label;
    o.debounce_ms = config.selection_debounce_ms;
    return o;
}

Cockpit::Cockpit(SurfaceHost& host, NotesService& notes, const CockpitConfig& config)
    : config_(config),
      panes_(state_),
      lifecycle_(host, layout_, frames_, config.layout_retry_attempts),
      bounds_(host, layout_, frames_, lifecycle_, config.settle_burst_frames),
      bridge_(host, state_, panes_, bridge_options(config)),
      appender_(notes),
      draft_(notes, config.note_autosave_delay_ms),
      notifications_(config.toast_ttl_ms)
{
    lifecycle_.set_script_provider([this](const std::string& label)
                                   { return bridge_.init_scripts_for(label); });
    lifecycle_.set_on_created(
        [this](const std::string& label)
        {
            bridge_.resolve_capability(label);
            bounds_.start_burst();
        });
}

Cockpit::~Cockpit()
{
    close();
}

// ─── Session ────────────────────────────────────────────────────────────────

std::string Cockpit::context_url(const CockpitContext& context) const
{
    if (auto url = parse_user_url(context.url))
        return *url;
    if (!context.url.empty())
        LECTERN_LOG_WARN("cockpit", "Ignoring invalid context URL '{}'", context.url);
    return normalize_url(config_.default_url);
}

void Cockpit::open(const CockpitContext& context, FrameTime now)
{
    if (state_.open)
    {
        retarget(context, now);
        return;
    }

    LECTERN_LOG_INFO("cockpit", "Opening cockpit on '{}'", context.url);
    state_.open    = true;
    state_.context = context;
    panes_.reset();

    PanePatch first;
    first.current_url = context_url(context);
    first.title       = context.title.value_or("");
    panes_.update_pane(0, first);

    state_.note_target = resolve_note_target(context);
    state_.selection   = SelectionState{};
    bind_note(now);

    bridge_.subscribe();
    bounds_.start();

    panes_.set_pane_count(config_.initial_pane_count);
    for (size_t i = 1; i < panes_.pane_count(); ++i)
        seed_pane(i);
    for (size_t i = 0; i < panes_.pane_count(); ++i)
        ensure_pane(i);
    bounds_.start_burst();
}

void Cockpit::retarget(const CockpitContext& context, FrameTime now)
{
    LECTERN_LOG_INFO("cockpit", "Retargeting cockpit to '{}'", context.url);
    state_.context     = context;
    state_.note_target = resolve_note_target(context);
    state_.selection   = SelectionState{};
    bind_note(now);

    const std::string url = context_url(context);
    PanePatch         patch;
    patch.current_url = url;
    patch.title       = context.title.value_or("");
    panes_.update_pane(0, patch);

    const std::string& label = panes_.pane(0).label;
    if (!lifecycle_.navigate(label, url))
        lifecycle_.ensure(label, url);
}

void Cockpit::close()
{
    if (!state_.open)
        return;

    LECTERN_LOG_INFO("cockpit", "Closing cockpit");
    bounds_.stop();
    for (size_t i = 0; i < MAX_PANES; ++i)
    {
        const std::string label = PaneRegistry::label_for(i);
        lifecycle_.close(label);
        layout_.unmount(label);
    }
    bridge_.unsubscribe();
    state_.bridge.clear();

    if (!draft_.save_now())
        LECTERN_LOG_WARN("cockpit", "Unsaved note edits were lost on close");
    draft_.unbind();

    state_.selection   = SelectionState{};
    state_.context     = CockpitContext{};
    state_.note_target = std::monostate{};
    panes_.reset();
    state_.open = false;
}

bool Cockpit::bind_note(FrameTime now)
{
    if (draft_.bind(state_.note_target))
        return true;
    notifications_.post(NotificationKind::Error, "Could not load note: " + draft_.error(), now);
    return false;
}

bool Cockpit::reload_note(FrameTime now)
{
    return state_.open && bind_note(now);
}

// ─── Panes ──────────────────────────────────────────────────────────────────

void Cockpit::seed_pane(size_t index)
{
    PanePatch patch;
    patch.title       = "Pane " + std::to_string(index + 1);
    patch.current_url = normalize_url(config_.default_url);
    panes_.update_pane(index, patch);
}

void Cockpit::ensure_pane(size_t index)
{
    const Pane& pane = panes_.pane(index);
    bounds_.attach(pane.label);
    lifecycle_.ensure(pane.label,
                      pane.current_url.empty() ? config_.default_url : pane.current_url);
}

void Cockpit::teardown_pane(const std::string& label)
{
    bounds_.detach(label);
    lifecycle_.close(label);
    layout_.unmount(label);
    bridge_.forget(label);
    if (auto idx = panes_.index_of(label))
    {
        PanePatch blank;
        blank.title       = "";
        blank.current_url = "";
        panes_.update_pane(*idx, blank);
    }
}

size_t Cockpit::set_pane_count(size_t n)
{
    PaneCountChange change = panes_.set_pane_count(n);
    if (!state_.open)
        return panes_.pane_count();

    for (const auto& label : change.removed)
        teardown_pane(label);
    for (const auto& label : change.added)
    {
        if (auto idx = panes_.index_of(label))
        {
            seed_pane(*idx);
            ensure_pane(*idx);
        }
    }
    if (!change.added.empty() || !change.removed.empty())
        bounds_.start_burst();
    return panes_.pane_count();
}

size_t Cockpit::select_pane(size_t index)
{
    return panes_.select_pane(index);
}

// ─── Navigation ─────────────────────────────────────────────────────────────

bool Cockpit::submit_url(const std::string& text, FrameTime now)
{
    auto url = parse_user_url(text);
    if (!url)
    {
        notifications_.post(NotificationKind::Error, "Invalid URL: " + text, now);
        return false;
    }
    if (!state_.open)
        return false;

    const size_t idx = panes_.active_index();
    PanePatch    patch;
    patch.current_url = *url;
    panes_.update_pane(idx, patch);

    const std::string& label = panes_.pane(idx).label;
    if (!lifecycle_.navigate(label, *url))
        lifecycle_.ensure(label, *url);
    return true;
}

bool Cockpit::go_back()
{
    return state_.open && lifecycle_.go_back(panes_.active_pane().label);
}

bool Cockpit::go_forward()
{
    return state_.open && lifecycle_.go_forward(panes_.active_pane().label);
}

bool Cockpit::reload()
{
    return state_.open && lifecycle_.reload(panes_.active_pane().label);
}

// ─── Selection and notes ────────────────────────────────────────────────────

bool Cockpit::paste_selection(FrameTime now)
{
    if (bridge_.paste_from_clipboard())
        return true;
    notifications_.post(NotificationKind::Info, "Clipboard has no text to paste", now);
    return false;
}

void Cockpit::set_selection_text(std::string text)
{
    state_.selection.text = std::move(text);
    if (state_.selection.source_url.empty())
    {
        state_.selection.source_url   = panes_.active_pane().current_url;
        state_.selection.source_title = panes_.active_pane().title;
    }
}

bool Cockpit::can_add_to_notes() const
{
    return SnippetAppender::can_append(state_.note_target, state_.selection);
}

AppendResult Cockpit::add_selection_to_notes(FrameTime now)
{
    if (can_add_to_notes() && draft_.dirty() && !draft_.save_now())
    {
        AppendResult failed;
        failed.outcome = AppendOutcome::Failed;
        failed.message = "Save your note edits before adding the selection: " + draft_.error();
        notifications_.post(NotificationKind::Error, failed.message, now);
        return failed;
    }

    AppendResult result = appender_.append(state_.note_target, state_.selection);
    if (result.ok())
    {
        if (result.note)
            draft_.adopt(*result.note);
        notifications_.post(NotificationKind::Success, result.message, now);
    }
    else
    {
        notifications_.post(NotificationKind::Error, result.message, now);
    }
    return result;
}

BridgeCapability Cockpit::active_bridge_capability() const
{
    auto it = state_.bridge.find(state_.panes[state_.active_pane].label);
    return it == state_.bridge.end() ? BridgeCapability::Unknown : it->second;
}

// ─── Frame ──────────────────────────────────────────────────────────────────

void Cockpit::frame(FrameTime now)
{
    frames_.tick();
    notifications_.prune(now);
    draft_.tick(now);
}

}   // namespace lectern
