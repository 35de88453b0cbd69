#pragma once

#include <lectern/cockpit_types.hpp>
#include <lectern/notes.hpp>
#include <optional>
#include <string>

namespace lectern
{

enum class AppendOutcome
{
    Appended,
    NoTarget,
    EmptySelection,
    Failed,
};

const char* append_outcome_name(AppendOutcome outcome);

struct AppendResult
{
    AppendOutcome       outcome = AppendOutcome::NoTarget;
    std::string         message;
    std::optional<Note> note;   // set when Appended

    bool ok() const { return outcome == AppendOutcome::Appended; }
};

// Writes the captured selection onto the target's main note.  Service errors
// are caught here and reported through the result; on anything but success
// the selection is left exactly as it was.
class SnippetAppender
{
   public:
    explicit SnippetAppender(NotesService& notes) : notes_(notes) {}

    // Same gate the UI uses for the "Add to notes" affordance.
    static bool can_append(const NoteTarget& target, const SelectionState& selection);

    AppendResult append(const NoteTarget& target, SelectionState& selection);

   private:
    NotesService& notes_;
};

}   // namespace lectern
