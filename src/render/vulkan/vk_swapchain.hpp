#pragma once

#include <cstdint>
#include <vector>
#include <vulkan/vulkan.h>

namespace lectern::vk
{

// Swapchain plus the color-only render pass and framebuffers the cockpit UI
// draws into.
struct SwapchainContext
{
    VkSwapchainKHR             swapchain    = VK_NULL_HANDLE;
    VkFormat                   image_format = VK_FORMAT_B8G8R8A8_UNORM;
    VkExtent2D                 extent       = {0, 0};
    uint32_t                   min_image_count = 2;
    std::vector<VkImage>       images;
    std::vector<VkImageView>   image_views;
    VkRenderPass               render_pass = VK_NULL_HANDLE;
    std::vector<VkFramebuffer> framebuffers;
};

struct SwapchainSupportDetails
{
    VkSurfaceCapabilitiesKHR        capabilities{};
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR>   present_modes;
};

SwapchainSupportDetails query_swapchain_support(VkPhysicalDevice device, VkSurfaceKHR surface);

VkSurfaceFormatKHR choose_surface_format(const std::vector<VkSurfaceFormatKHR>& formats);
VkExtent2D         choose_extent(const VkSurfaceCapabilitiesKHR& capabilities,
                                 uint32_t                        width,
                                 uint32_t                        height);

VkRenderPass create_render_pass(VkDevice device, VkFormat color_format);

// Throws std::runtime_error on failure.  When `reuse_render_pass` is set the
// new context adopts it instead of creating one.
SwapchainContext create_swapchain(VkDevice         device,
                                  VkPhysicalDevice physical_device,
                                  VkSurfaceKHR     surface,
                                  uint32_t         width,
                                  uint32_t         height,
                                  uint32_t         graphics_family,
                                  uint32_t         present_family,
                                  VkSwapchainKHR   old_swapchain     = VK_NULL_HANDLE,
                                  VkRenderPass     reuse_render_pass = VK_NULL_HANDLE);

void destroy_swapchain(VkDevice device, SwapchainContext& ctx, bool skip_render_pass = false);

}   // namespace lectern::vk
