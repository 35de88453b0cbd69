#pragma once

#include <lectern/cockpit_types.hpp>
#include <optional>
#include <string>

namespace lectern
{

// (entity type, entity id) a note target writes to.
struct NoteAddress
{
    std::string entity_type;
    EntityId    entity_id = 0;

    bool operator==(const NoteAddress&) const = default;
};

// explicit target > reference > idea > writing > none.  An id of 0 counts as
// absent.
NoteTarget resolve_note_target(const CockpitContext& context);

// nullopt for the "no target" alternative.
std::optional<NoteAddress> note_address(const NoteTarget& target);

// Short human-readable description ("Idea #7", "No note target").
std::string describe_note_target(const NoteTarget& target);

}   // namespace lectern
