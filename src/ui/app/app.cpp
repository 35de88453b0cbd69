#include "app.hpp"

#include <lectern/logger.hpp>
#include <utility>

#if defined(LECTERN_USE_GLFW) && defined(LECTERN_USE_IMGUI)

    #include <imgui.h>

    #include "../../cockpit/cockpit.hpp"
    #include "../../notes/in_memory_notes.hpp"
    #include "../../platform/glfw_surface_host.hpp"
    #include "../../render/vulkan/vk_host_renderer.hpp"
    #include "../cockpit_panel.hpp"
    #include "../imgui_integration.hpp"

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>

#endif

namespace lectern
{

CockpitApp::CockpitApp(CockpitConfig config) : config_(std::move(config)) {}

#if defined(LECTERN_USE_GLFW) && defined(LECTERN_USE_IMGUI)

static void glfw_error_callback(int code, const char* description)
{
    LECTERN_LOG_ERROR("glfw", "GLFW error {}: {}", code, description ? description : "");
}

// ImGui coordinates per logical unit of the host window.
static float pixels_per_logical(GLFWwindow* window)
{
    float xs = 1.0f, ys = 1.0f;
    glfwGetWindowContentScale(window, &xs, &ys);
    const float fb_scale = ImGui::GetIO().DisplayFramebufferScale.x;
    if (xs <= 0.0f || fb_scale <= 0.0f)
        return 1.0f;
    return xs / fb_scale;
}

static bool recreate(vk::HostRenderer& renderer, ImGuiIntegration& imgui, GLFWwindow* window)
{
    int w = 0, h = 0;
    glfwGetFramebufferSize(window, &w, &h);
    if (w <= 0 || h <= 0)
        return false;
    renderer.wait_idle();
    if (!renderer.recreate_swapchain(static_cast<uint32_t>(w), static_cast<uint32_t>(h)))
        return false;
    imgui.on_swapchain_recreated(renderer);
    return true;
}

int CockpitApp::run(const CockpitContext& context)
{
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit())
    {
        LECTERN_LOG_CRITICAL("glfw", "glfwInit failed");
        return 1;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    GLFWwindow* window = glfwCreateWindow(static_cast<int>(config_.window_width),
                                          static_cast<int>(config_.window_height),
                                          "Lectern Cockpit",
                                          nullptr,
                                          nullptr);
    if (!window)
    {
        LECTERN_LOG_CRITICAL("glfw", "Failed to create the host window");
        glfwTerminate();
        return 1;
    }

    int exit_code = 0;
    {
        vk::HostRenderer renderer;
    #ifdef NDEBUG
        const bool validation = false;
    #else
        const bool validation = true;
    #endif
        if (!renderer.init(window, validation))
        {
            LECTERN_LOG_CRITICAL("vulkan", "Vulkan initialization failed");
            glfwDestroyWindow(window);
            glfwTerminate();
            return 1;
        }

        // Installs the host window callbacks before ImGui chains its own.
        GlfwSurfaceHost host(window);

        ImGuiIntegration imgui;
        if (!imgui.init(renderer, window))
        {
            LECTERN_LOG_CRITICAL("ui", "ImGui initialization failed");
            exit_code = 1;
        }
        else
        {
            InMemoryNotesService notes;
            Cockpit              cockpit(host, notes, config_);
            CockpitPanel         panel(cockpit);

            cockpit.open(context, FrameClock::now());

            while (!glfwWindowShouldClose(window))
            {
                glfwPollEvents();

                int fb_w = 0, fb_h = 0;
                glfwGetFramebufferSize(window, &fb_w, &fb_h);
                if (fb_w == 0 || fb_h == 0)
                {
                    glfwWaitEvents();
                    continue;
                }

                if (renderer.swapchain_dirty() && !recreate(renderer, imgui, window))
                    continue;

                host.pump();

                const FrameTime now = FrameClock::now();
                if (panel.reopen_requested())
                {
                    panel.clear_reopen_request();
                    cockpit.open(context, now);
                }

                if (!renderer.begin_frame())
                {
                    recreate(renderer, imgui, window);
                    continue;
                }

                imgui.new_frame();
                panel.draw(now, pixels_per_logical(window));
                cockpit.frame(now);

                renderer.begin_render_pass(0.07f, 0.08f, 0.09f, 1.0f);
                imgui.render(renderer);
                renderer.end_render_pass();
                renderer.end_frame();
            }

            renderer.wait_idle();
            cockpit.close();
        }

        imgui.shutdown();
        renderer.shutdown();
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    LECTERN_LOG_INFO("cockpit", "Exited");
    return exit_code;
}

#else

int CockpitApp::run(const CockpitContext& /*context*/)
{
    LECTERN_LOG_CRITICAL("cockpit", "Built without LECTERN_USE_GLFW and LECTERN_USE_IMGUI");
    return 1;
}

#endif

}   // namespace lectern
