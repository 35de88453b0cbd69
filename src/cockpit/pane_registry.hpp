#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "cockpit_state.hpp"

namespace lectern
{

struct PanePatch
{
    std::optional<std::string> title;
    std::optional<std::string> current_url;
};

struct PaneCountChange
{
    std::vector<std::string> added;     // labels that became active
    std::vector<std::string> removed;   // labels that became inactive
};

// Pane slot bookkeeping over CockpitState.  Pure data, no I/O: creating and
// closing the surfaces behind added/removed labels is the caller's job.
class PaneRegistry
{
   public:
    explicit PaneRegistry(CockpitState& state);

    // Label of slot `index`: "pane-1" .. "pane-N".
    static std::string label_for(size_t index);

    // Restores every slot to its label with empty title/url, one active pane.
    void reset();

    // Clamps n to [1, MAX_PANES].  When the active pane falls outside the new
    // range it becomes pane_count - 1.
    PaneCountChange set_pane_count(size_t n);

    // Returns false for an index outside the fixed pool.
    bool update_pane(size_t index, const PanePatch& patch);

    // Clamped to the active range.  Returns the index actually selected.
    size_t select_pane(size_t index);

    size_t pane_count() const { return state_.pane_count; }
    size_t active_index() const { return state_.active_pane; }

    const Pane& pane(size_t index) const { return state_.panes.at(index); }
    const Pane& active_pane() const { return state_.panes[state_.active_pane]; }

    std::optional<size_t>    index_of(const std::string& label) const;
    bool                     is_active_label(const std::string& label) const;
    std::vector<std::string> active_labels() const;

   private:
    CockpitState& state_;
};

}   // namespace lectern
