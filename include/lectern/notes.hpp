#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <lectern/cockpit_types.hpp>

namespace lectern
{

inline constexpr const char* MAIN_NOTE_TYPE = "main";

struct Note
{
    int64_t     id = 0;
    std::string entity_type;
    EntityId    entity_id = 0;
    std::string note_type = MAIN_NOTE_TYPE;
    std::string body_html;
    std::string created_at;
    std::string updated_at;
};

class NotesError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// Notes store owned by the rest of the application.  Notes are keyed by
// (entity type, entity id, note type).  Every operation throws NotesError on
// failure.
class NotesService
{
   public:
    virtual ~NotesService() = default;

    virtual Note get_or_create(const std::string& entity_type,
                               EntityId           entity_id,
                               const std::string& note_type) = 0;

    virtual Note upsert(const std::string& entity_type,
                        EntityId           entity_id,
                        const std::string& note_type,
                        const std::string& body_html) = 0;

    virtual Note append_snippet(const std::string&                entity_type,
                                EntityId                          entity_id,
                                const std::string&                note_type,
                                const std::string&                snippet_text,
                                const std::optional<std::string>& source_url,
                                const std::optional<std::string>& source_title) = 0;
};

}   // namespace lectern
