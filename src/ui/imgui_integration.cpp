#ifdef LECTERN_USE_IMGUI

    #include "imgui_integration.hpp"

    #include <imgui.h>
    #include <imgui_impl_glfw.h>
    #include <imgui_impl_vulkan.h>
    #include <lectern/logger.hpp>

    #include "../render/vulkan/vk_host_renderer.hpp"

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>

namespace lectern
{

// ─── Lifecycle ──────────────────────────────────────────────────────────────

ImGuiIntegration::~ImGuiIntegration()
{
    shutdown();
}

static ImGui_ImplVulkan_InitInfo make_init_info(vk::HostRenderer& renderer)
{
    ImGui_ImplVulkan_InitInfo ii{};
    ii.Instance       = renderer.instance();
    ii.PhysicalDevice = renderer.physical_device();
    ii.Device         = renderer.device();
    ii.QueueFamily    = renderer.graphics_queue_family();
    ii.Queue          = renderer.graphics_queue();
    ii.DescriptorPool = renderer.descriptor_pool();
    ii.MinImageCount  = renderer.min_image_count();
    ii.ImageCount     = renderer.image_count();
    ii.RenderPass     = renderer.render_pass();
    ii.MSAASamples    = VK_SAMPLE_COUNT_1_BIT;
    return ii;
}

bool ImGuiIntegration::init(vk::HostRenderer& renderer, GLFWwindow* window, bool install_callbacks)
{
    if (initialized_)
        return true;
    if (!window)
        return false;

    glfw_window_ = window;

    IMGUI_CHECKVERSION();
    owned_font_atlas_ = std::make_unique<ImFontAtlas>();
    imgui_context_    = ImGui::CreateContext(owned_font_atlas_.get());
    ImGui::SetCurrentContext(imgui_context_);

    ImGuiIO& io    = ImGui::GetIO();
    io.IniFilename = nullptr;

    float xs = 1.0f, ys = 1.0f;
    glfwGetWindowContentScale(window, &xs, &ys);
    apply_style();
    load_fonts(xs > 0.0f ? xs : 1.0f);

    ImGui_ImplGlfw_InitForVulkan(window, install_callbacks);

    ImGui_ImplVulkan_InitInfo ii = make_init_info(renderer);
    ImGui_ImplVulkan_Init(&ii);
    ImGui_ImplVulkan_CreateFontsTexture();

    cached_render_pass_ = reinterpret_cast<uint64_t>(ii.RenderPass);
    initialized_        = true;
    LECTERN_LOG_DEBUG("imgui", "ImGui initialized (content scale {})", xs);
    return true;
}

void ImGuiIntegration::shutdown()
{
    if (!initialized_)
        return;

    ImGui::SetCurrentContext(imgui_context_);
    ImGui_ImplVulkan_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext(imgui_context_);
    imgui_context_ = nullptr;
    ImGui::SetCurrentContext(nullptr);

    owned_font_atlas_.reset();
    initialized_ = false;
}

void ImGuiIntegration::on_swapchain_recreated(vk::HostRenderer& renderer)
{
    if (!initialized_)
        return;

    ImGui_ImplVulkan_SetMinImageCount(renderer.min_image_count());

    // A format change gives a new render pass; ImGui must be re-initialized
    // against it.
    VkRenderPass current_rp      = renderer.render_pass();
    auto         current_rp_bits = reinterpret_cast<uint64_t>(current_rp);
    if (current_rp_bits != cached_render_pass_ && current_rp != VK_NULL_HANDLE)
    {
        LECTERN_LOG_WARN("imgui", "Render pass changed, reinitializing ImGui Vulkan backend");
        ImGui_ImplVulkan_Shutdown();
        ImGui_ImplVulkan_InitInfo ii = make_init_info(renderer);
        ImGui_ImplVulkan_Init(&ii);
        ImGui_ImplVulkan_CreateFontsTexture();
        cached_render_pass_ = current_rp_bits;
    }
}

void ImGuiIntegration::new_frame()
{
    if (!initialized_)
        return;
    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void ImGuiIntegration::render(vk::HostRenderer& renderer)
{
    if (!initialized_)
        return;
    ImGui::Render();
    auto* dd = ImGui::GetDrawData();
    if (dd)
        ImGui_ImplVulkan_RenderDrawData(dd, renderer.current_command_buffer());
}

bool ImGuiIntegration::wants_capture_mouse() const
{
    if (!initialized_)
        return false;
    return ImGui::GetIO().WantCaptureMouse;
}

bool ImGuiIntegration::wants_capture_keyboard() const
{
    if (!initialized_)
        return false;
    return ImGui::GetIO().WantCaptureKeyboard;
}

// ─── Fonts & style ──────────────────────────────────────────────────────────

void ImGuiIntegration::load_fonts(float scale)
{
    ImGuiIO& io = ImGui::GetIO();

    ImFontConfig cfg;
    cfg.SizePixels = 15.0f * scale;
    font_body_     = io.Fonts->AddFontDefault(&cfg);

    ImFontConfig heading_cfg;
    heading_cfg.SizePixels = 18.0f * scale;
    font_heading_          = io.Fonts->AddFontDefault(&heading_cfg);

    io.FontDefault = font_body_;
    ImGui::GetStyle().ScaleAllSizes(scale);
}

void ImGuiIntegration::apply_style()
{
    ImGui::StyleColorsDark();
    ImGuiStyle& style       = ImGui::GetStyle();
    style.WindowRounding    = 0.0f;
    style.FrameRounding     = 4.0f;
    style.ChildRounding     = 4.0f;
    style.WindowBorderSize  = 0.0f;
    style.FramePadding      = ImVec2(8.0f, 5.0f);
    style.ItemSpacing       = ImVec2(8.0f, 6.0f);

    ImVec4* c                  = style.Colors;
    c[ImGuiCol_WindowBg]       = ImVec4(0.11f, 0.12f, 0.14f, 1.0f);
    c[ImGuiCol_ChildBg]        = ImVec4(0.08f, 0.09f, 0.10f, 1.0f);
    c[ImGuiCol_Button]         = ImVec4(0.20f, 0.22f, 0.26f, 1.0f);
    c[ImGuiCol_ButtonHovered]  = ImVec4(0.26f, 0.40f, 0.62f, 1.0f);
    c[ImGuiCol_ButtonActive]   = ImVec4(0.22f, 0.34f, 0.54f, 1.0f);
    c[ImGuiCol_Header]         = ImVec4(0.22f, 0.34f, 0.54f, 0.6f);
}

}   // namespace lectern

#endif   // LECTERN_USE_IMGUI
