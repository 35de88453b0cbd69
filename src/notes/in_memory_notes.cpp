#include "in_memory_notes.hpp"

#include <chrono>
#include <ctime>
#include <lectern/logger.hpp>

#include "../core/text.hpp"

namespace lectern
{

InMemoryNotesService::InMemoryNotesService() : clock_(&InMemoryNotesService::utc_now) {}

InMemoryNotesService::InMemoryNotesService(Clock clock) : clock_(std::move(clock))
{
    if (!clock_)
        clock_ = &InMemoryNotesService::utc_now;
}

std::string InMemoryNotesService::utc_now()
{
    auto        now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm     tm_buf{};
    gmtime_r(&now, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

void InMemoryNotesService::validate_entity_type(const std::string& entity_type)
{
    if (entity_type == "idea" || entity_type == "reference" || entity_type == "writing")
        return;
    throw NotesError("Invalid entity type '" + entity_type
                     + "'. Must be one of: idea, reference, writing");
}

std::string InMemoryNotesService::effective_note_type(const std::string& note_type)
{
    return note_type.empty() ? std::string(MAIN_NOTE_TYPE) : note_type;
}

Note InMemoryNotesService::get_or_create(const std::string& entity_type,
                                         EntityId           entity_id,
                                         const std::string& note_type)
{
    validate_entity_type(entity_type);
    Key key{entity_type, entity_id, effective_note_type(note_type)};

    auto it = notes_.find(key);
    if (it != notes_.end())
        return it->second;

    Note note;
    note.id          = next_id_++;
    note.entity_type = entity_type;
    note.entity_id   = entity_id;
    note.note_type   = std::get<2>(key);
    note.created_at  = clock_();
    note.updated_at  = note.created_at;
    notes_.emplace(key, note);
    LECTERN_LOG_DEBUG("notes", "Created note {} for {} #{}", note.id, entity_type, entity_id);
    return note;
}

Note InMemoryNotesService::upsert(const std::string& entity_type,
                                  EntityId           entity_id,
                                  const std::string& note_type,
                                  const std::string& body_html)
{
    Note note       = get_or_create(entity_type, entity_id, note_type);
    note.body_html  = body_html;
    note.updated_at = clock_();
    notes_[Key{entity_type, entity_id, note.note_type}] = note;
    return note;
}

std::string InMemoryNotesService::snippet_html(const std::string&                existing_body,
                                               const std::string&                snippet_text,
                                               const std::optional<std::string>& source_url,
                                               const std::optional<std::string>& source_title,
                                               const std::string&                timestamp)
{
    std::string out;
    if (!is_blank(existing_body))
        out += "<hr />\n";

    out += "<p>" + html_escape(snippet_text) + "</p>\n";

    if (source_url && !source_url->empty())
    {
        const std::string& title =
            source_title && !source_title->empty() ? *source_title : *source_url;
        out += "<p><small>Source: <a href=\"" + html_escape(*source_url) + "\">"
               + html_escape(title) + "</a> \xC2\xB7 " + html_escape(timestamp)
               + "</small></p>\n";
    }
    else
    {
        out += "<p><small>Captured " + html_escape(timestamp) + "</small></p>\n";
    }
    return out;
}

Note InMemoryNotesService::append_snippet(const std::string&                entity_type,
                                          EntityId                          entity_id,
                                          const std::string&                note_type,
                                          const std::string&                snippet_text,
                                          const std::optional<std::string>& source_url,
                                          const std::optional<std::string>& source_title)
{
    Note note = get_or_create(entity_type, entity_id, note_type);
    std::string body =
        note.body_html + snippet_html(note.body_html, snippet_text, source_url, source_title, clock_());
    return upsert(entity_type, entity_id, note.note_type, body);
}

}   // namespace lectern
