#include "note_target.hpp"

namespace lectern
{

static bool present(const std::optional<EntityId>& id)
{
    return id.has_value() && *id != 0;
}

NoteTarget resolve_note_target(const CockpitContext& context)
{
    if (context.note_target)
        return *context.note_target;

    if (present(context.reference_id))
    {
        ReferenceNote t;
        t.reference_id = *context.reference_id;
        if (present(context.idea_id))
            t.idea_id = context.idea_id;
        return t;
    }
    if (present(context.idea_id))
        return IdeaNote{*context.idea_id};
    if (present(context.writing_id))
        return WritingNote{*context.writing_id};
    return std::monostate{};
}

std::optional<NoteAddress> note_address(const NoteTarget& target)
{
    if (auto* r = std::get_if<ReferenceNote>(&target))
        return NoteAddress{"reference", r->reference_id};
    if (auto* i = std::get_if<IdeaNote>(&target))
        return NoteAddress{"idea", i->idea_id};
    if (auto* w = std::get_if<WritingNote>(&target))
        return NoteAddress{"writing", w->writing_id};
    return std::nullopt;
}

std::string describe_note_target(const NoteTarget& target)
{
    if (auto* r = std::get_if<ReferenceNote>(&target))
        return "Reference #" + std::to_string(r->reference_id);
    if (auto* i = std::get_if<IdeaNote>(&target))
        return "Idea #" + std::to_string(i->idea_id);
    if (auto* w = std::get_if<WritingNote>(&target))
        return "Writing #" + std::to_string(w->writing_id);
    return "No note target";
}

}   // namespace lectern
