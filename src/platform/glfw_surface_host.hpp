#pragma once

#ifdef LECTERN_USE_GLFW

    #include <cstdint>
    #include <memory>
    #include <lectern/surface_host.hpp>
    #include <string>
    #include <unordered_map>
    #include <vector>

    #include "../core/listener_list.hpp"

struct GLFWwindow;

namespace lectern
{

// SurfaceHost over GLFW.  Each surface is an undecorated, floating GLFW
// window that never takes focus on show, positioned in screen pixels over
// the host window.  It keeps a per-surface navigation history but renders no
// page content and runs no script, so it cannot inject init scripts.
class GlfwSurfaceHost : public SurfaceHost
{
   public:
    explicit GlfwSurfaceHost(GLFWwindow* host_window);
    ~GlfwSurfaceHost() override;

    GlfwSurfaceHost(const GlfwSurfaceHost&)            = delete;
    GlfwSurfaceHost& operator=(const GlfwSurfaceHost&) = delete;

    // Creates queued surfaces and delivers their acks.  Call once per frame.
    void pump();

    void create_surface(const SurfaceCreateRequest& request, CreateCallback on_done) override;
    std::optional<SurfaceHandle> get_by_label(const std::string& label) const override;

    bool set_position(const std::string& label, int32_t x, int32_t y) override;
    bool set_size(const std::string& label, uint32_t width, uint32_t height) override;
    bool show(const std::string& label) override;
    bool set_focus(const std::string& label) override;

    bool navigate(const std::string& label, const std::string& url) override;
    bool go_back(const std::string& label) override;
    bool go_forward(const std::string& label) override;
    bool reload(const std::string& label) override;
    bool close(const std::string& label) override;

    Subscription on_window_moved(WindowEventFn fn) override;
    Subscription on_window_resized(WindowEventFn fn) override;
    Subscription on_scale_factor_changed(WindowEventFn fn) override;

    bool   window_inner_position(double& x, double& y) const override;
    double window_scale_factor() const override;

    Subscription listen(const std::string& channel, ChannelListener fn) override;

    bool supports_init_scripts() const override { return false; }

    std::optional<std::string> read_clipboard_text() override;

    size_t surface_count() const { return surfaces_.size(); }

   private:
    struct Surface
    {
        SurfaceHandle            handle = INVALID_SURFACE;
        GLFWwindow*              window = nullptr;
        std::vector<std::string> history;
        size_t                   cursor = 0;
    };

    struct PendingCreate
    {
        SurfaceCreateRequest request;
        CreateCallback       on_done;
    };

    Surface*    find(const std::string& label);
    void        create_now(PendingCreate& pending);
    static void update_title(const std::string& label, Surface& s);

    static void window_pos_callback(GLFWwindow* window, int x, int y);
    static void window_size_callback(GLFWwindow* window, int width, int height);
    static void content_scale_callback(GLFWwindow* window, float xs, float ys);

    GLFWwindow* host_window_ = nullptr;

    std::unordered_map<std::string, Surface> surfaces_;
    std::vector<PendingCreate>               pending_;
    SurfaceHandle                            next_handle_ = 1;

    ListenerList<WindowEventFn> moved_;
    ListenerList<WindowEventFn> resized_;
    ListenerList<WindowEventFn> scale_changed_;

    std::unordered_map<std::string, std::unique_ptr<ListenerList<ChannelListener>>> channels_;
};

}   // namespace lectern

#endif   // LECTERN_USE_GLFW
