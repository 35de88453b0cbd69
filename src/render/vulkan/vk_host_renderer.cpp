#include "vk_host_renderer.hpp"

#define GLFW_INCLUDE_NONE
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <lectern/logger.hpp>
#include <stdexcept>

namespace lectern::vk
{

HostRenderer::~HostRenderer()
{
    shutdown();
}

bool HostRenderer::init(GLFWwindow* window, bool enable_validation)
{
    if (initialized_)
        return true;
    if (!window)
        return false;

    try
    {
        ctx_.instance = create_instance(enable_validation);
        if (enable_validation)
            ctx_.debug_messenger = create_debug_messenger(ctx_.instance);

        if (glfwCreateWindowSurface(ctx_.instance, window, nullptr, &surface_) != VK_SUCCESS)
            throw std::runtime_error("Failed to create Vulkan surface for the host window");

        ctx_.physical_device = pick_physical_device(ctx_.instance, surface_);
        ctx_.queue_families  = find_queue_families(ctx_.physical_device, surface_);
        ctx_.device = create_logical_device(ctx_.physical_device, ctx_.queue_families, enable_validation);

        vkGetDeviceQueue(ctx_.device, ctx_.queue_families.graphics.value(), 0, &ctx_.graphics_queue);
        vkGetDeviceQueue(ctx_.device, ctx_.queue_families.present.value(), 0, &ctx_.present_queue);

        create_command_pool();
        create_descriptor_pool();

        int w = 0, h = 0;
        glfwGetFramebufferSize(window, &w, &h);
        swapchain_ = create_swapchain(ctx_.device,
                                      ctx_.physical_device,
                                      surface_,
                                      static_cast<uint32_t>(w),
                                      static_cast<uint32_t>(h),
                                      ctx_.queue_families.graphics.value(),
                                      ctx_.queue_families.present.value());
        create_command_buffers();
        create_sync_objects();

        initialized_ = true;
        LECTERN_LOG_INFO("vulkan",
                         "Host renderer ready ({}x{}, {} images)",
                         swapchain_.extent.width,
                         swapchain_.extent.height,
                         swapchain_.images.size());
        return true;
    }
    catch (const std::exception& e)
    {
        LECTERN_LOG_ERROR("vulkan", "Host renderer init failed: {}", e.what());
        initialized_ = true;   // let shutdown() release what was created
        shutdown();
        return false;
    }
}

void HostRenderer::shutdown()
{
    if (!initialized_)
        return;
    initialized_ = false;

    if (ctx_.device != VK_NULL_HANDLE)
    {
        vkDeviceWaitIdle(ctx_.device);
        destroy_sync_objects();
        if (command_pool_ != VK_NULL_HANDLE)
            vkDestroyCommandPool(ctx_.device, command_pool_, nullptr);
        command_pool_ = VK_NULL_HANDLE;
        command_buffers_.clear();
        if (descriptor_pool_ != VK_NULL_HANDLE)
            vkDestroyDescriptorPool(ctx_.device, descriptor_pool_, nullptr);
        descriptor_pool_ = VK_NULL_HANDLE;
        destroy_swapchain(ctx_.device, swapchain_);
        vkDestroyDevice(ctx_.device, nullptr);
    }
    if (surface_ != VK_NULL_HANDLE)
        vkDestroySurfaceKHR(ctx_.instance, surface_, nullptr);
    surface_ = VK_NULL_HANDLE;

    if (ctx_.debug_messenger != VK_NULL_HANDLE)
        destroy_debug_messenger(ctx_.instance, ctx_.debug_messenger);
    if (ctx_.instance != VK_NULL_HANDLE)
        vkDestroyInstance(ctx_.instance, nullptr);
    ctx_ = {};
}

void HostRenderer::wait_idle()
{
    if (ctx_.device != VK_NULL_HANDLE)
        vkDeviceWaitIdle(ctx_.device);
}

// ─── Resources ──────────────────────────────────────────────────────────────

void HostRenderer::create_command_pool()
{
    VkCommandPoolCreateInfo info{};
    info.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    info.flags            = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    info.queueFamilyIndex = ctx_.queue_families.graphics.value();

    if (vkCreateCommandPool(ctx_.device, &info, nullptr, &command_pool_) != VK_SUCCESS)
        throw std::runtime_error("Failed to create command pool");
}

void HostRenderer::create_descriptor_pool()
{
    // ImGui needs one combined image sampler for its font atlas.
    VkDescriptorPoolSize pool_sizes[] = {
        {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 16},
    };

    VkDescriptorPoolCreateInfo info{};
    info.sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    info.flags         = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    info.maxSets       = 16;
    info.poolSizeCount = 1;
    info.pPoolSizes    = pool_sizes;

    if (vkCreateDescriptorPool(ctx_.device, &info, nullptr, &descriptor_pool_) != VK_SUCCESS)
        throw std::runtime_error("Failed to create descriptor pool");
}

void HostRenderer::create_command_buffers()
{
    if (!command_buffers_.empty())
    {
        vkFreeCommandBuffers(ctx_.device,
                             command_pool_,
                             static_cast<uint32_t>(command_buffers_.size()),
                             command_buffers_.data());
    }

    command_buffers_.resize(swapchain_.images.size());

    VkCommandBufferAllocateInfo info{};
    info.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    info.commandPool        = command_pool_;
    info.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    info.commandBufferCount = static_cast<uint32_t>(command_buffers_.size());

    if (vkAllocateCommandBuffers(ctx_.device, &info, command_buffers_.data()) != VK_SUCCESS)
        throw std::runtime_error("Failed to allocate command buffers");
}

void HostRenderer::create_sync_objects()
{
    // One set per swapchain image so a semaphore is never reused while the
    // presentation engine still holds it.
    const size_t count = swapchain_.images.size();
    image_available_.resize(count, VK_NULL_HANDLE);
    render_finished_.resize(count, VK_NULL_HANDLE);
    in_flight_.resize(count, VK_NULL_HANDLE);

    VkSemaphoreCreateInfo sem_info{};
    sem_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    VkFenceCreateInfo fence_info{};
    fence_info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fence_info.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    for (size_t i = 0; i < count; ++i)
    {
        if (vkCreateSemaphore(ctx_.device, &sem_info, nullptr, &image_available_[i]) != VK_SUCCESS
            || vkCreateSemaphore(ctx_.device, &sem_info, nullptr, &render_finished_[i]) != VK_SUCCESS
            || vkCreateFence(ctx_.device, &fence_info, nullptr, &in_flight_[i]) != VK_SUCCESS)
        {
            throw std::runtime_error("Failed to create sync objects");
        }
    }
    flight_frame_ = 0;
}

void HostRenderer::destroy_sync_objects()
{
    for (auto sem : image_available_)
        if (sem != VK_NULL_HANDLE)
            vkDestroySemaphore(ctx_.device, sem, nullptr);
    for (auto sem : render_finished_)
        if (sem != VK_NULL_HANDLE)
            vkDestroySemaphore(ctx_.device, sem, nullptr);
    for (auto fence : in_flight_)
        if (fence != VK_NULL_HANDLE)
            vkDestroyFence(ctx_.device, fence, nullptr);
    image_available_.clear();
    render_finished_.clear();
    in_flight_.clear();
}

bool HostRenderer::recreate_swapchain(uint32_t width, uint32_t height)
{
    if (!initialized_ || width == 0 || height == 0)
        return false;

    if (!in_flight_.empty())
    {
        vkWaitForFences(ctx_.device,
                        static_cast<uint32_t>(in_flight_.size()),
                        in_flight_.data(),
                        VK_TRUE,
                        UINT64_MAX);
    }

    SwapchainContext old = swapchain_;
    try
    {
        swapchain_ = create_swapchain(ctx_.device,
                                      ctx_.physical_device,
                                      surface_,
                                      width,
                                      height,
                                      ctx_.queue_families.graphics.value(),
                                      ctx_.queue_families.present.value(),
                                      old.swapchain,
                                      old.render_pass);
        destroy_swapchain(ctx_.device, old, /*skip_render_pass=*/true);

        if (swapchain_.images.size() != old.images.size())
        {
            destroy_sync_objects();
            create_sync_objects();
            create_command_buffers();
        }
        flight_frame_    = 0;
        swapchain_dirty_ = false;
        LECTERN_LOG_DEBUG("vulkan",
                          "Swapchain recreated: {}x{}",
                          swapchain_.extent.width,
                          swapchain_.extent.height);
        return true;
    }
    catch (const std::exception& e)
    {
        LECTERN_LOG_ERROR("vulkan", "Swapchain recreation failed: {}", e.what());
        swapchain_ = old;
        return false;
    }
}

// ─── Frame ──────────────────────────────────────────────────────────────────

bool HostRenderer::begin_frame()
{
    if (!initialized_)
        return false;

    vkWaitForFences(ctx_.device, 1, &in_flight_[flight_frame_], VK_TRUE, UINT64_MAX);

    VkResult result = vkAcquireNextImageKHR(ctx_.device,
                                            swapchain_.swapchain,
                                            UINT64_MAX,
                                            image_available_[flight_frame_],
                                            VK_NULL_HANDLE,
                                            &image_index_);
    if (result == VK_ERROR_OUT_OF_DATE_KHR)
    {
        swapchain_dirty_ = true;
        return false;
    }
    if (result == VK_SUBOPTIMAL_KHR)
        swapchain_dirty_ = true;
    else if (result != VK_SUCCESS)
    {
        LECTERN_LOG_ERROR("vulkan", "vkAcquireNextImageKHR failed ({})", static_cast<int>(result));
        return false;
    }

    vkResetFences(ctx_.device, 1, &in_flight_[flight_frame_]);

    current_cmd_ = command_buffers_[flight_frame_];
    vkResetCommandBuffer(current_cmd_, 0);

    VkCommandBufferBeginInfo begin_info{};
    begin_info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    vkBeginCommandBuffer(current_cmd_, &begin_info);
    return true;
}

void HostRenderer::begin_render_pass(float r, float g, float b, float a)
{
    VkClearValue clear{};
    clear.color = {{r, g, b, a}};

    VkRenderPassBeginInfo info{};
    info.sType           = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    info.renderPass      = swapchain_.render_pass;
    info.framebuffer     = swapchain_.framebuffers[image_index_];
    info.renderArea      = {{0, 0}, swapchain_.extent};
    info.clearValueCount = 1;
    info.pClearValues    = &clear;

    vkCmdBeginRenderPass(current_cmd_, &info, VK_SUBPASS_CONTENTS_INLINE);
}

void HostRenderer::end_render_pass()
{
    vkCmdEndRenderPass(current_cmd_);
}

void HostRenderer::end_frame()
{
    vkEndCommandBuffer(current_cmd_);

    // image_available follows the flight frame (matches acquire);
    // render_finished follows the swapchain image.
    VkSemaphore          wait_semaphores[]   = {image_available_[flight_frame_]};
    VkSemaphore          signal_semaphores[] = {render_finished_[image_index_]};
    VkPipelineStageFlags wait_stages[]       = {VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT};

    VkSubmitInfo submit{};
    submit.sType                = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submit.waitSemaphoreCount   = 1;
    submit.pWaitSemaphores      = wait_semaphores;
    submit.pWaitDstStageMask    = wait_stages;
    submit.commandBufferCount   = 1;
    submit.pCommandBuffers      = &current_cmd_;
    submit.signalSemaphoreCount = 1;
    submit.pSignalSemaphores    = signal_semaphores;

    if (vkQueueSubmit(ctx_.graphics_queue, 1, &submit, in_flight_[flight_frame_]) != VK_SUCCESS)
        LECTERN_LOG_ERROR("vulkan", "vkQueueSubmit failed");

    VkPresentInfoKHR present{};
    present.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    present.waitSemaphoreCount = 1;
    present.pWaitSemaphores    = signal_semaphores;
    present.swapchainCount     = 1;
    present.pSwapchains        = &swapchain_.swapchain;
    present.pImageIndices      = &image_index_;

    VkResult result = vkQueuePresentKHR(ctx_.present_queue, &present);
    flight_frame_   = (flight_frame_ + 1) % static_cast<uint32_t>(in_flight_.size());

    if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR)
        swapchain_dirty_ = true;
    else if (result != VK_SUCCESS)
        LECTERN_LOG_ERROR("vulkan", "vkQueuePresentKHR failed ({})", static_cast<int>(result));
}

}   // namespace lectern::vk
