#include "note_draft.hpp"

#include <lectern/logger.hpp>

namespace lectern
{

const char* draft_status_name(DraftStatus status)
{
    switch (status)
    {
        case DraftStatus::Idle:
            return "idle";
        case DraftStatus::Saving:
            return "saving";
        case DraftStatus::Saved:
            return "saved";
        case DraftStatus::Error:
            return "error";
    }
    return "unknown";
}

NoteDraft::NoteDraft(NotesService& notes, uint32_t autosave_delay_ms)
    : notes_(notes), autosave_delay_ms_(autosave_delay_ms)
{
}

bool NoteDraft::bind(const NoteTarget& target)
{
    auto address = note_address(target);
    // Same target: keep the draft, unless the last load failed.
    if (address && address_ && *address == *address_ && loaded_)
        return status_ != DraftStatus::Error;

    // Do not lose edits made against the previous target.
    if (dirty_)
        save_now();

    unbind();
    if (!address)
        return true;

    address_ = std::move(address);
    try
    {
        Note note = notes_.get_or_create(address_->entity_type, address_->entity_id, MAIN_NOTE_TYPE);
        text_     = note.body_html;
        loaded_   = true;
        status_   = DraftStatus::Idle;
        return true;
    }
    catch (const NotesError& e)
    {
        status_ = DraftStatus::Error;
        error_  = e.what();
        LECTERN_LOG_ERROR("notes",
                          "Loading note for {} #{} failed: {}",
                          address_->entity_type,
                          address_->entity_id,
                          e.what());
        return false;
    }
}

void NoteDraft::unbind()
{
    address_.reset();
    text_.clear();
    loaded_ = false;
    dirty_  = false;
    status_ = DraftStatus::Idle;
    error_.clear();
}

void NoteDraft::edit(std::string text, FrameTime now)
{
    if (!address_ || !loaded_ || text == text_)
        return;
    text_      = std::move(text);
    dirty_     = true;
    last_edit_ = now;
    status_    = DraftStatus::Saving;
}

bool NoteDraft::tick(FrameTime now)
{
    if (!dirty_ || status_ == DraftStatus::Error)
        return false;
    if (now - last_edit_ < std::chrono::milliseconds(autosave_delay_ms_))
        return false;
    return save();
}

bool NoteDraft::save_now()
{
    if (!dirty_)
        return true;
    return save();
}

bool NoteDraft::save()
{
    // Never write a body that did not start from the stored note.
    if (!address_ || !loaded_)
        return false;
    try
    {
        notes_.upsert(address_->entity_type, address_->entity_id, MAIN_NOTE_TYPE, text_);
        dirty_  = false;
        status_ = DraftStatus::Saved;
        error_.clear();
        return true;
    }
    catch (const NotesError& e)
    {
        // Stays dirty; the next edit or save_now() retries.
        status_ = DraftStatus::Error;
        error_  = e.what();
        LECTERN_LOG_ERROR("notes", "Saving note failed: {}", e.what());
        return false;
    }
}

bool NoteDraft::adopt(const Note& note)
{
    if (!address_ || note.entity_type != address_->entity_type
        || note.entity_id != address_->entity_id)
        return false;
    if (dirty_)
    {
        LECTERN_LOG_WARN("notes", "Keeping unsaved edits over the stored note");
        return false;
    }
    text_   = note.body_html;
    loaded_ = true;
    status_ = DraftStatus::Saved;
    error_.clear();
    return true;
}

}   // namespace lectern
