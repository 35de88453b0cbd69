#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace lectern
{

using EntityId = int64_t;

inline constexpr size_t MAX_PANES = 3;

struct Pane
{
    std::string label;
    std::string title;
    std::string current_url;
};

struct ReferenceNote
{
    EntityId                reference_id = 0;
    std::optional<EntityId> idea_id;

    bool operator==(const ReferenceNote&) const = default;
};

struct IdeaNote
{
    EntityId idea_id = 0;

    bool operator==(const IdeaNote&) const = default;
};

struct WritingNote
{
    EntityId writing_id = 0;

    bool operator==(const WritingNote&) const = default;
};

// std::monostate is the "no target" alternative.
using NoteTarget = std::variant<std::monostate, ReferenceNote, IdeaNote, WritingNote>;

inline bool has_target(const NoteTarget& target)
{
    return !std::holds_alternative<std::monostate>(target);
}

// Which entity opened the cockpit.
struct CockpitContext
{
    std::string                url;
    std::optional<std::string> title;
    std::optional<EntityId>    reference_id;
    std::optional<EntityId>    idea_id;
    std::optional<EntityId>    writing_id;
    std::optional<NoteTarget>  note_target;
};

struct SelectionState
{
    std::string text;
    std::string source_url;
    std::string source_title;
};

}   // namespace lectern
