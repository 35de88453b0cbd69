#pragma once

#include <functional>
#include <lectern/notes.hpp>
#include <map>
#include <string>
#include <tuple>

namespace lectern
{

// Notes store kept in process memory.  Used by the desktop cockpit when no
// other store is wired in, and by tests.
class InMemoryNotesService : public NotesService
{
   public:
    // Returns the timestamp stamped on notes and snippets.
    using Clock = std::function<std::string()>;

    InMemoryNotesService();
    explicit InMemoryNotesService(Clock clock);

    Note get_or_create(const std::string& entity_type,
                       EntityId           entity_id,
                       const std::string& note_type) override;

    Note upsert(const std::string& entity_type,
                EntityId           entity_id,
                const std::string& note_type,
                const std::string& body_html) override;

    Note append_snippet(const std::string&                entity_type,
                        EntityId                          entity_id,
                        const std::string&                note_type,
                        const std::string&                snippet_text,
                        const std::optional<std::string>& source_url,
                        const std::optional<std::string>& source_title) override;

    size_t note_count() const { return notes_.size(); }

    // UTC, "2026-01-31T12:00:00Z".
    static std::string utc_now();

    // The HTML appended for one snippet.
    static std::string snippet_html(const std::string&                existing_body,
                                    const std::string&                snippet_text,
                                    const std::optional<std::string>& source_url,
                                    const std::optional<std::string>& source_title,
                                    const std::string&                timestamp);

   private:
    using Key = std::tuple<std::string, EntityId, std::string>;

    static void        validate_entity_type(const std::string& entity_type);
    static std::string effective_note_type(const std::string& note_type);

    Clock             clock_;
    std::map<Key, Note> notes_;
    int64_t           next_id_ = 1;
};

}   // namespace lectern
