#include "selection_bridge.hpp"

#include <lectern/logger.hpp>
#include <sstream>

#include "../core/json_util.hpp"
#include "../core/text.hpp"

namespace lectern
{

std::optional<SelectionPayload> decode_selection_payload(const std::string& json)
{
    if (!json::looks_like_object(json))
        return std::nullopt;

    auto selection = json::read_string(json, "selection");
    if (!selection)
        return std::nullopt;

    SelectionPayload p;
    p.selection     = std::move(*selection);
    p.title         = json::read_string(json, "title");
    p.url           = json::read_string(json, "url");
    p.webview_label = json::read_string(json, "webviewLabel");
    return p;
}

static std::string js_string(const std::string& s)
{
    return "\"" + json::escape(s) + "\"";
}

std::string selection_bridge_script(const std::string& channel,
                                    const std::string& host_label,
                                    const std::string& source_label,
                                    uint32_t           debounce_ms)
{
    std::ostringstream os;
    os << "(() => {\n"
       << "  const CHANNEL = " << js_string(channel) << ";\n"
       << "  const HOST = " << js_string(host_label) << ";\n"
       << "  const LABEL = " << js_string(source_label) << ";\n"
       << "  const emit = (payload) => {\n"
       << "    try {\n"
       << "      const ipc = window.__LECTERN_IPC__;\n"
       << "      if (!ipc || typeof ipc.emitTo !== 'function') return;\n"
       << "      payload.webviewLabel = LABEL;\n"
       << "      ipc.emitTo(HOST, CHANNEL, JSON.stringify(payload));\n"
       << "    } catch (_) {}\n"
       << "  };\n"
       << "  let last = '';\n"
       << "  let timer = null;\n"
       << "  const publish = () => {\n"
       << "    const sel = ((window.getSelection && window.getSelection().toString()) || '').trim();\n"
       << "    if (sel === last) return;\n"
       << "    last = sel;\n"
       << "    emit({ selection: sel, title: document.title || '', url: location.href });\n"
       << "  };\n"
       << "  document.addEventListener('selectionchange', () => {\n"
       << "    if (timer) clearTimeout(timer);\n"
       << "    timer = setTimeout(publish, " << debounce_ms << ");\n"
       << "  });\n"
       << "  window.addEventListener('mouseup', publish);\n"
       << "  window.addEventListener('keyup', publish);\n"
       << "  emit({ selection: '', title: document.title || '', url: location.href });\n"
       << "})();\n";
    return os.str();
}

SelectionBridge::SelectionBridge(SurfaceHost&           host,
                                 CockpitState&          state,
                                 PaneRegistry&          panes,
                                 SelectionBridgeOptions options)
    : host_(host), state_(state), panes_(panes), options_(std::move(options))
{
}

bool SelectionBridge::subscribe()
{
    if (subscription_.active())
        return false;
    subscription_ = host_.listen(options_.channel,
                                 [this](const ChannelMessage& msg) { handle_message(msg); });
    LECTERN_LOG_DEBUG("bridge", "Listening on '{}'", options_.channel);
    return true;
}

void SelectionBridge::unsubscribe()
{
    subscription_.reset();
}

// ─── Capability ─────────────────────────────────────────────────────────────

BridgeCapability SelectionBridge::resolve_capability(const std::string& label)
{
    auto it = state_.bridge.find(label);
    if (it != state_.bridge.end() && it->second != BridgeCapability::Unknown)
        return it->second;

    BridgeCapability cap =
        host_.supports_init_scripts() ? BridgeCapability::Available : BridgeCapability::Unavailable;
    state_.bridge[label] = cap;
    LECTERN_LOG_INFO("bridge", "Selection bridge for '{}': {}", label, bridge_capability_name(cap));
    return cap;
}

BridgeCapability SelectionBridge::capability(const std::string& label) const
{
    auto it = state_.bridge.find(label);
    return it == state_.bridge.end() ? BridgeCapability::Unknown : it->second;
}

void SelectionBridge::forget(const std::string& label)
{
    state_.bridge.erase(label);
}

std::vector<std::string> SelectionBridge::init_scripts_for(const std::string& label) const
{
    if (!host_.supports_init_scripts())
        return {};
    return {selection_bridge_script(options_.channel, options_.host_label, label, options_.debounce_ms)};
}

// ─── Incoming ───────────────────────────────────────────────────────────────

void SelectionBridge::handle_message(const ChannelMessage& message)
{
    auto payload = decode_selection_payload(message.payload_json);
    if (!payload)
    {
        LECTERN_LOG_DEBUG("bridge", "Dropping malformed payload from '{}'", message.source_label);
        return;
    }

    const std::string& label =
        payload->webview_label && !payload->webview_label->empty() ? *payload->webview_label
                                                                   : message.source_label;

    std::string pane_title;
    std::string pane_url;
    if (auto idx = panes_.index_of(label))
    {
        PanePatch patch;
        if (payload->title && !payload->title->empty())
            patch.title = *payload->title;
        if (payload->url && !payload->url->empty())
            patch.current_url = *payload->url;
        panes_.update_pane(*idx, patch);
        pane_title = panes_.pane(*idx).title;
        pane_url   = panes_.pane(*idx).current_url;
    }

    // A collapsed selection in the page clears the buffer too.
    SelectionState sel;
    sel.text         = trim(payload->selection);
    sel.source_url   = payload->url && !payload->url->empty() ? *payload->url : pane_url;
    sel.source_title = payload->title && !payload->title->empty() ? *payload->title : pane_title;
    state_.selection = std::move(sel);
    LECTERN_LOG_TRACE("bridge", "Selection from '{}' ({} chars)", label, state_.selection.text.size());
}

// ─── Clipboard fallback ─────────────────────────────────────────────────────

bool SelectionBridge::paste_from_clipboard()
{
    auto clip = host_.read_clipboard_text();
    if (!clip)
    {
        LECTERN_LOG_DEBUG("bridge", "Clipboard unavailable");
        return false;
    }
    std::string text = trim(*clip);
    if (text.empty())
        return false;

    const Pane& active           = panes_.active_pane();
    state_.selection.text         = std::move(text);
    state_.selection.source_url   = active.current_url;
    state_.selection.source_title = active.title;
    return true;
}

}   // namespace lectern
