#pragma once

#include <array>
#include <cstddef>
#include <lectern/cockpit_types.hpp>
#include <string>
#include <unordered_map>

namespace lectern
{

enum class BridgeCapability
{
    Unknown,
    Available,
    Unavailable,
};

// All mutable cockpit session state.  Owned by Cockpit and handed by
// reference to the components; pane fields are only written through
// PaneRegistry so label uniqueness and active-pane clamping hold.
struct CockpitState
{
    bool open = false;

    std::array<Pane, MAX_PANES> panes;
    size_t                      pane_count  = 1;
    size_t                      active_pane = 0;

    CockpitContext context;
    NoteTarget     note_target;
    SelectionState selection;

    // Resolved once per surface, when the surface is created.
    std::unordered_map<std::string, BridgeCapability> bridge;
};

const char* bridge_capability_name(BridgeCapability cap);

}   // namespace lectern
