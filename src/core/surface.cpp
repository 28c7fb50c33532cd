#include "fine2d/core/surface.hpp"
#include "fine2d/core/instance.hpp"
#include "fine2d/core/logging.hpp"

namespace fine2d {

Surface::~Surface() {
    if (surface_ != VK_NULL_HANDLE && instance_ != nullptr) {
        vkDestroySurfaceKHR(instance_->handle(), surface_, nullptr);
        FINE2D_DEBUG(LogCategory::Core, "Surface destroyed");
    }
}

} // namespace fine2d
