#pragma once

#ifdef LECTERN_USE_IMGUI

    #include <cstdint>
    #include <memory>

struct GLFWwindow;
struct ImFont;
struct ImFontAtlas;
struct ImGuiContext;

namespace lectern
{

namespace vk
{
class HostRenderer;
}

class ImGuiIntegration
{
   public:
    ImGuiIntegration() = default;
    ~ImGuiIntegration();

    ImGuiIntegration(const ImGuiIntegration&)            = delete;
    ImGuiIntegration& operator=(const ImGuiIntegration&) = delete;

    // Callbacks the host window already has (position, size, content scale)
    // are left alone; ImGui chains its own input callbacks on top.
    bool init(vk::HostRenderer& renderer, GLFWwindow* window, bool install_callbacks = true);
    void shutdown();

    void new_frame();
    void render(vk::HostRenderer& renderer);

    void on_swapchain_recreated(vk::HostRenderer& renderer);

    bool wants_capture_mouse() const;
    bool wants_capture_keyboard() const;

    ImFont* font_body() const { return font_body_; }
    ImFont* font_heading() const { return font_heading_; }

   private:
    void apply_style();
    void load_fonts(float scale);

    bool          initialized_ = false;
    GLFWwindow*   glfw_window_ = nullptr;
    ImGuiContext* imgui_context_ = nullptr;
    uint64_t      cached_render_pass_ = 0;

    std::unique_ptr<ImFontAtlas> owned_font_atlas_;
    ImFont*                      font_body_    = nullptr;
    ImFont*                      font_heading_ = nullptr;
};

}   // namespace lectern

#endif   // LECTERN_USE_IMGUI
