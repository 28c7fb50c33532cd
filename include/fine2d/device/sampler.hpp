#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <memory>

namespace fine2d {

class LogicalDevice;

/**
 * @brief Vulkan sampler wrapper
 */
class Sampler {
public:
    /**
     * @brief Builder for creating Sampler objects
     *
     * Defaults: linear filtering, clamp-to-edge addressing, transparent black
     * border, no mipmaps.
     */
    class Builder {
    public:
        explicit Builder(LogicalDevice* device);

        /// Same filter for minification and magnification
        Builder& filter(VkFilter filter);

        /// Address modes along U (x) and V (y)
        Builder& addressMode(VkSamplerAddressMode u, VkSamplerAddressMode v);

        /// Border color used by CLAMP_TO_BORDER
        Builder& borderColor(VkBorderColor color);

        SamplerPtr build();

    private:
        LogicalDevice* device_;
        VkSamplerCreateInfo createInfo_{};
    };

    static Builder create(LogicalDevice* device);

    VkSampler handle() const { return sampler_; }

    ~Sampler();

    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

private:
    friend class Builder;
    Sampler() = default;

    LogicalDevice* device_ = nullptr;
    VkSampler sampler_ = VK_NULL_HANDLE;
};

} // namespace fine2d
