#ifdef LECTERN_USE_GLFW

    #include "glfw_surface_host.hpp"

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>
    #include <algorithm>
    #include <lectern/logger.hpp>

namespace lectern
{

GlfwSurfaceHost::GlfwSurfaceHost(GLFWwindow* host_window) : host_window_(host_window)
{
    if (!host_window_)
        return;
    glfwSetWindowUserPointer(host_window_, this);
    glfwSetWindowPosCallback(host_window_, window_pos_callback);
    glfwSetWindowSizeCallback(host_window_, window_size_callback);
    glfwSetWindowContentScaleCallback(host_window_, content_scale_callback);
}

GlfwSurfaceHost::~GlfwSurfaceHost()
{
    pending_.clear();
    for (auto& [label, s] : surfaces_)
    {
        if (s.window)
            glfwDestroyWindow(s.window);
    }
    surfaces_.clear();

    if (host_window_)
    {
        glfwSetWindowPosCallback(host_window_, nullptr);
        glfwSetWindowSizeCallback(host_window_, nullptr);
        glfwSetWindowContentScaleCallback(host_window_, nullptr);
        glfwSetWindowUserPointer(host_window_, nullptr);
    }
}

// ─── Creation ───────────────────────────────────────────────────────────────

void GlfwSurfaceHost::create_surface(const SurfaceCreateRequest& request, CreateCallback on_done)
{
    pending_.push_back(PendingCreate{request, std::move(on_done)});
}

void GlfwSurfaceHost::pump()
{
    // Acks may queue new requests; handle only what was pending on entry.
    std::vector<PendingCreate> batch;
    batch.swap(pending_);
    for (auto& p : batch)
        create_now(p);
}

void GlfwSurfaceHost::create_now(PendingCreate& pending)
{
    const auto&         req = pending.request;
    SurfaceCreateResult result;

    if (surfaces_.count(req.label))
    {
        result.error = "a surface labelled '" + req.label + "' already exists";
    }
    else
    {
        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
        glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);
        glfwWindowHint(GLFW_DECORATED, GLFW_FALSE);
        glfwWindowHint(GLFW_FLOATING, GLFW_TRUE);
        glfwWindowHint(GLFW_FOCUS_ON_SHOW, GLFW_FALSE);
        glfwWindowHint(GLFW_FOCUSED, GLFW_FALSE);
        glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);

        GLFWwindow* win = glfwCreateWindow(static_cast<int>(req.rect.width),
                                           static_cast<int>(req.rect.height),
                                           req.label.c_str(),
                                           nullptr,
                                           nullptr);

        glfwDefaultWindowHints();

        if (!win)
        {
            result.error = "glfwCreateWindow failed";
        }
        else
        {
            glfwSetWindowPos(win, req.rect.x, req.rect.y);

            Surface s;
            s.handle = next_handle_++;
            s.window = win;
            s.history.push_back(req.url);
            update_title(req.label, s);
            result.ok     = true;
            result.handle = s.handle;
            surfaces_.emplace(req.label, std::move(s));
            if (!req.init_scripts.empty())
            {
                LECTERN_LOG_DEBUG("glfw",
                                  "Ignoring {} init script(s) for '{}'",
                                  req.init_scripts.size(),
                                  req.label);
            }
        }
    }

    if (pending.on_done)
        pending.on_done(result);
}

GlfwSurfaceHost::Surface* GlfwSurfaceHost::find(const std::string& label)
{
    auto it = surfaces_.find(label);
    return it == surfaces_.end() ? nullptr : &it->second;
}

std::optional<SurfaceHandle> GlfwSurfaceHost::get_by_label(const std::string& label) const
{
    auto it = surfaces_.find(label);
    if (it == surfaces_.end())
        return std::nullopt;
    return it->second.handle;
}

// ─── Placement ──────────────────────────────────────────────────────────────

bool GlfwSurfaceHost::set_position(const std::string& label, int32_t x, int32_t y)
{
    Surface* s = find(label);
    if (!s)
        return false;
    glfwSetWindowPos(s->window, x, y);
    return true;
}

bool GlfwSurfaceHost::set_size(const std::string& label, uint32_t width, uint32_t height)
{
    Surface* s = find(label);
    if (!s)
        return false;
    glfwSetWindowSize(s->window, static_cast<int>(width), static_cast<int>(height));
    return true;
}

bool GlfwSurfaceHost::show(const std::string& label)
{
    Surface* s = find(label);
    if (!s)
        return false;
    glfwShowWindow(s->window);
    return true;
}

bool GlfwSurfaceHost::set_focus(const std::string& label)
{
    Surface* s = find(label);
    if (!s)
        return false;
    glfwFocusWindow(s->window);
    return true;
}

// ─── Navigation ─────────────────────────────────────────────────────────────

void GlfwSurfaceHost::update_title(const std::string& label, Surface& s)
{
    std::string title = label;
    if (s.cursor < s.history.size())
        title += ": " + s.history[s.cursor];
    glfwSetWindowTitle(s.window, title.c_str());
}

bool GlfwSurfaceHost::navigate(const std::string& label, const std::string& url)
{
    Surface* s = find(label);
    if (!s)
        return false;
    if (!s->history.empty())
        s->history.resize(s->cursor + 1);
    s->history.push_back(url);
    s->cursor = s->history.size() - 1;
    update_title(label, *s);
    return true;
}

bool GlfwSurfaceHost::go_back(const std::string& label)
{
    Surface* s = find(label);
    if (!s || s->cursor == 0)
        return false;
    --s->cursor;
    update_title(label, *s);
    return true;
}

bool GlfwSurfaceHost::go_forward(const std::string& label)
{
    Surface* s = find(label);
    if (!s || s->cursor + 1 >= s->history.size())
        return false;
    ++s->cursor;
    update_title(label, *s);
    return true;
}

bool GlfwSurfaceHost::reload(const std::string& label)
{
    Surface* s = find(label);
    if (!s)
        return false;
    update_title(label, *s);
    return true;
}

bool GlfwSurfaceHost::close(const std::string& label)
{
    auto it = surfaces_.find(label);
    if (it == surfaces_.end())
        return false;
    if (it->second.window)
        glfwDestroyWindow(it->second.window);
    surfaces_.erase(it);
    return true;
}

// ─── Host window ────────────────────────────────────────────────────────────

Subscription GlfwSurfaceHost::on_window_moved(WindowEventFn fn)
{
    return moved_.add(std::move(fn));
}

Subscription GlfwSurfaceHost::on_window_resized(WindowEventFn fn)
{
    return resized_.add(std::move(fn));
}

Subscription GlfwSurfaceHost::on_scale_factor_changed(WindowEventFn fn)
{
    return scale_changed_.add(std::move(fn));
}

bool GlfwSurfaceHost::window_inner_position(double& x, double& y) const
{
    if (!host_window_)
        return false;
    int ix = 0, iy = 0;
    glfwGetWindowPos(host_window_, &ix, &iy);
    x = ix;
    y = iy;
    return true;
}

double GlfwSurfaceHost::window_scale_factor() const
{
    if (!host_window_)
        return 1.0;
    float xs = 1.0f, ys = 1.0f;
    glfwGetWindowContentScale(host_window_, &xs, &ys);
    return xs > 0.0f ? xs : 1.0;
}

Subscription GlfwSurfaceHost::listen(const std::string& channel, ChannelListener fn)
{
    auto& list = channels_[channel];
    if (!list)
        list = std::make_unique<ListenerList<ChannelListener>>();
    return list->add(std::move(fn));
}

std::optional<std::string> GlfwSurfaceHost::read_clipboard_text()
{
    const char* text = glfwGetClipboardString(host_window_);
    if (!text)
        return std::nullopt;
    return std::string(text);
}

// ─── Static callback trampolines ────────────────────────────────────────────

void GlfwSurfaceHost::window_pos_callback(GLFWwindow* window, int /*x*/, int /*y*/)
{
    auto* host = static_cast<GlfwSurfaceHost*>(glfwGetWindowUserPointer(window));
    if (host)
        host->moved_.notify();
}

void GlfwSurfaceHost::window_size_callback(GLFWwindow* window, int /*width*/, int /*height*/)
{
    auto* host = static_cast<GlfwSurfaceHost*>(glfwGetWindowUserPointer(window));
    if (host)
        host->resized_.notify();
}

void GlfwSurfaceHost::content_scale_callback(GLFWwindow* window, float /*xs*/, float /*ys*/)
{
    auto* host = static_cast<GlfwSurfaceHost*>(glfwGetWindowUserPointer(window));
    if (host)
        host->scale_changed_.notify();
}

}   // namespace lectern

#endif   // LECTERN_USE_GLFW
