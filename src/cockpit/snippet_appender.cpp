#include "snippet_appender.hpp"

#include <lectern/logger.hpp>

#include "../core/text.hpp"
#include "note_target.hpp"

namespace lectern
{

const char* append_outcome_name(AppendOutcome outcome)
{
    switch (outcome)
    {
        case AppendOutcome::Appended:
            return "appended";
        case AppendOutcome::NoTarget:
            return "no-target";
        case AppendOutcome::EmptySelection:
            return "empty-selection";
        case AppendOutcome::Failed:
            return "failed";
    }
    return "unknown";
}

bool SnippetAppender::can_append(const NoteTarget& target, const SelectionState& selection)
{
    return has_target(target) && !is_blank(selection.text);
}

static std::optional<std::string> non_empty(const std::string& s)
{
    if (s.empty())
        return std::nullopt;
    return s;
}

AppendResult SnippetAppender::append(const NoteTarget& target, SelectionState& selection)
{
    AppendResult result;

    auto address = note_address(target);
    if (!address)
    {
        result.outcome = AppendOutcome::NoTarget;
        result.message = "No note target for this cockpit session";
        return result;
    }

    if (is_blank(selection.text))
    {
        result.outcome = AppendOutcome::EmptySelection;
        result.message = "Nothing selected";
        return result;
    }

    try
    {
        Note note = notes_.append_snippet(address->entity_type,
                                          address->entity_id,
                                          MAIN_NOTE_TYPE,
                                          selection.text,
                                          non_empty(selection.source_url),
                                          non_empty(selection.source_title));
        selection.text.clear();
        result.outcome = AppendOutcome::Appended;
        result.message = "Added to notes";
        result.note    = std::move(note);
        LECTERN_LOG_INFO("notes",
                         "Appended snippet to {} #{}",
                         address->entity_type,
                         address->entity_id);
    }
    catch (const NotesError& e)
    {
        result.outcome = AppendOutcome::Failed;
        result.message = std::string("Failed to add to notes: ") + e.what();
        LECTERN_LOG_ERROR("notes",
                          "append_snippet({} #{}) failed: {}",
                          address->entity_type,
                          address->entity_id,
                          e.what());
    }
    return result;
}

}   // namespace lectern
