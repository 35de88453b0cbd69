#pragma once

#include <cstdint>
#include <vector>
#include <vulkan/vulkan.h>

#include "vk_device.hpp"
#include "vk_swapchain.hpp"

struct GLFWwindow;

namespace lectern::vk
{

// Vulkan state for the host window: device, swapchain and the per-frame
// command buffers the cockpit UI records into.  Child surfaces are separate
// OS windows and never touch this renderer.
class HostRenderer
{
   public:
    HostRenderer() = default;
    ~HostRenderer();

    HostRenderer(const HostRenderer&)            = delete;
    HostRenderer& operator=(const HostRenderer&) = delete;

    bool init(GLFWwindow* window, bool enable_validation);
    void shutdown();

    // False when the swapchain is out of date; recreate it and skip the frame.
    bool begin_frame();
    void begin_render_pass(float r, float g, float b, float a);
    void end_render_pass();
    void end_frame();

    bool recreate_swapchain(uint32_t width, uint32_t height);
    bool swapchain_dirty() const { return swapchain_dirty_; }

    void wait_idle();

    VkInstance       instance() const { return ctx_.instance; }
    VkPhysicalDevice physical_device() const { return ctx_.physical_device; }
    VkDevice         device() const { return ctx_.device; }
    uint32_t         graphics_queue_family() const { return ctx_.queue_families.graphics.value_or(0); }
    VkQueue          graphics_queue() const { return ctx_.graphics_queue; }
    VkDescriptorPool descriptor_pool() const { return descriptor_pool_; }
    uint32_t         min_image_count() const { return swapchain_.min_image_count; }
    uint32_t         image_count() const { return static_cast<uint32_t>(swapchain_.images.size()); }
    VkRenderPass     render_pass() const { return swapchain_.render_pass; }
    VkCommandBuffer  current_command_buffer() const { return current_cmd_; }

   private:
    void create_command_pool();
    void create_descriptor_pool();
    void create_command_buffers();
    void create_sync_objects();
    void destroy_sync_objects();

    DeviceContext    ctx_;
    VkSurfaceKHR     surface_ = VK_NULL_HANDLE;
    SwapchainContext swapchain_;

    VkCommandPool                command_pool_    = VK_NULL_HANDLE;
    VkDescriptorPool             descriptor_pool_ = VK_NULL_HANDLE;
    std::vector<VkCommandBuffer> command_buffers_;
    VkCommandBuffer              current_cmd_ = VK_NULL_HANDLE;

    std::vector<VkSemaphore> image_available_;
    std::vector<VkSemaphore> render_finished_;
    std::vector<VkFence>     in_flight_;
    uint32_t                 flight_frame_ = 0;
    uint32_t                 image_index_  = 0;

    bool swapchain_dirty_ = false;
    bool initialized_     = false;
};

}   // namespace lectern::vk
