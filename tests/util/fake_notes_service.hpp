#pragma once

// NotesService double that records calls and can be told to fail.

#include <lectern/notes.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lectern::test
{

class FakeNotesService : public NotesService
{
   public:
    struct AppendCall
    {
        std::string                entity_type;
        EntityId                   entity_id = 0;
        std::string                note_type;
        std::string                text;
        std::optional<std::string> source_url;
        std::optional<std::string> source_title;
    };

    std::vector<AppendCall> appends;
    std::vector<std::string> upserts;
    size_t                   get_or_create_calls = 0;

    bool        fail_appends = false;
    bool        fail_upserts = false;
    bool        fail_loads   = false;
    std::string stored_body;

    Note get_or_create(const std::string& entity_type,
                       EntityId           entity_id,
                       const std::string& note_type) override
    {
        ++get_or_create_calls;
        if (fail_loads)
            throw NotesError("notes store offline");
        return make_note(entity_type, entity_id, note_type);
    }

    Note upsert(const std::string& entity_type,
                EntityId           entity_id,
                const std::string& note_type,
                const std::string& body_html) override
    {
        if (fail_upserts)
            throw NotesError("write rejected");
        upserts.push_back(body_html);
        stored_body = body_html;
        return make_note(entity_type, entity_id, note_type);
    }

    Note append_snippet(const std::string&                entity_type,
                        EntityId                          entity_id,
                        const std::string&                note_type,
                        const std::string&                snippet_text,
                        const std::optional<std::string>& source_url,
                        const std::optional<std::string>& source_title) override
    {
        appends.push_back(
            AppendCall{entity_type, entity_id, note_type, snippet_text, source_url, source_title});
        if (fail_appends)
            throw NotesError("append rejected");
        stored_body += "<p>" + snippet_text + "</p>\n";
        return make_note(entity_type, entity_id, note_type);
    }

   private:
    Note make_note(const std::string& entity_type, EntityId entity_id, const std::string& note_type)
    {
        Note n;
        n.id          = 1;
        n.entity_type = entity_type;
        n.entity_id   = entity_id;
        n.note_type   = note_type;
        n.body_html   = stored_body;
        return n;
    }
};

}   // namespace lectern::test
