#pragma once

#include <lectern/cockpit_types.hpp>
#include <lectern/config.hpp>

namespace lectern
{

// The desktop cockpit: a GLFW host window rendered with Vulkan + ImGui,
// child surfaces per pane and an in-memory notes store.
class CockpitApp
{
   public:
    explicit CockpitApp(CockpitConfig config);

    CockpitApp(const CockpitApp&)            = delete;
    CockpitApp& operator=(const CockpitApp&) = delete;

    // Blocks until the host window closes.  Returns the process exit code.
    int run(const CockpitContext& context);

   private:
    CockpitConfig config_;
};

}   // namespace lectern
