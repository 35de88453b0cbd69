#pragma once

#include <cstdint>
#include <lectern/cockpit_types.hpp>
#include <lectern/notes.hpp>
#include <optional>
#include <string>

#include "../anim/frame_queue.hpp"
#include "note_target.hpp"

namespace lectern
{

enum class DraftStatus
{
    Idle,
    Saving,   // edited, autosave pending
    Saved,
    Error,
};

const char* draft_status_name(DraftStatus status);

// The inline note editor's model: the main note of the resolved target,
// edited locally and upserted after a quiet period.
class NoteDraft
{
   public:
    NoteDraft(NotesService& notes, uint32_t autosave_delay_ms);

    // Loads the target's note.  The "no target" alternative unbinds.  A load
    // failure leaves the draft bound but not loaded: status Error, and edits
    // and saves are refused until bind() is called again and succeeds.
    bool bind(const NoteTarget& target);
    void unbind();

    void edit(std::string text, FrameTime now);

    // Upserts once the last edit is autosave_delay old.  Returns true when a
    // save happened and succeeded.
    bool tick(FrameTime now);

    // Saves immediately if dirty.  Returns false only when a save failed.
    bool save_now();

    // Takes the note returned by another write (e.g. a snippet append).
    // Refused while local edits are unsaved.  Returns true when adopted.
    bool adopt(const Note& note);

    bool                              bound() const { return address_.has_value(); }
    bool                              loaded() const { return loaded_; }
    const std::optional<NoteAddress>& address() const { return address_; }
    const std::string&                text() const { return text_; }
    bool                              dirty() const { return dirty_; }
    DraftStatus                       status() const { return status_; }
    const std::string&                error() const { return error_; }

   private:
    bool save();

    NotesService& notes_;
    uint32_t      autosave_delay_ms_;

    std::optional<NoteAddress> address_;
    std::string                text_;
    bool                       loaded_ = false;
    bool                       dirty_  = false;
    FrameTime                  last_edit_{};
    DraftStatus                status_ = DraftStatus::Idle;
    std::string                error_;
};

}   // namespace lectern
