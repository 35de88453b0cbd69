#include "pane_registry.hpp"

#include <algorithm>
#include <lectern/logger.hpp>

namespace lectern
{

const char* bridge_capability_name(BridgeCapability cap)
{
    switch (cap)
    {
        case BridgeCapability::Unknown:
            return "unknown";
        case BridgeCapability::Available:
            return "available";
        case BridgeCapability::Unavailable:
            return "unavailable";
    }
    return "unknown";
}

PaneRegistry::PaneRegistry(CockpitState& state) : state_(state)
{
    reset();
}

std::string PaneRegistry::label_for(size_t index)
{
    return "pane-" + std::to_string(index + 1);
}

void PaneRegistry::reset()
{
    for (size_t i = 0; i < MAX_PANES; ++i)
    {
        Pane& p = state_.panes[i];
        p.label = label_for(i);
        p.title.clear();
        p.current_url.clear();
    }
    state_.pane_count  = 1;
    state_.active_pane = 0;
}

PaneCountChange PaneRegistry::set_pane_count(size_t n)
{
    n = std::clamp<size_t>(n, 1, MAX_PANES);

    PaneCountChange change;
    const size_t    old = state_.pane_count;
    for (size_t i = old; i < n; ++i)
        change.added.push_back(state_.panes[i].label);
    for (size_t i = n; i < old; ++i)
        change.removed.push_back(state_.panes[i].label);

    state_.pane_count = n;
    if (state_.active_pane >= n)
        state_.active_pane = n - 1;

    if (old != n)
    {
        LECTERN_LOG_DEBUG("panes", "Pane count {} -> {} (active {})", old, n, state_.active_pane);
    }
    return change;
}

bool PaneRegistry::update_pane(size_t index, const PanePatch& patch)
{
    if (index >= MAX_PANES)
        return false;
    Pane& p = state_.panes[index];
    if (patch.title)
        p.title = *patch.title;
    if (patch.current_url)
        p.current_url = *patch.current_url;
    return true;
}

size_t PaneRegistry::select_pane(size_t index)
{
    state_.active_pane = std::min(index, state_.pane_count - 1);
    return state_.active_pane;
}

std::optional<size_t> PaneRegistry::index_of(const std::string& label) const
{
    for (size_t i = 0; i < MAX_PANES; ++i)
    {
        if (state_.panes[i].label == label)
            return i;
    }
    return std::nullopt;
}

bool PaneRegistry::is_active_label(const std::string& label) const
{
    auto idx = index_of(label);
    return idx && *idx < state_.pane_count;
}

std::vector<std::string> PaneRegistry::active_labels() const
{
    std::vector<std::string> labels;
    labels.reserve(state_.pane_count);
    for (size_t i = 0; i < state_.pane_count; ++i)
        labels.push_back(state_.panes[i].label);
    return labels;
}

}   // namespace lectern
