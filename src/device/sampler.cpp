#include "fine2d/device/sampler.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/core/error.hpp"

namespace fine2d {

// ============================================================================
// Sampler::Builder implementation
// ============================================================================

Sampler::Builder::Builder(LogicalDevice* device)
    : device_(device) {
    createInfo_.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
    createInfo_.magFilter = VK_FILTER_LINEAR;
    createInfo_.minFilter = VK_FILTER_LINEAR;
    createInfo_.addressModeU = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    createInfo_.addressModeV = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    createInfo_.addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    createInfo_.anisotropyEnable = VK_FALSE;
    createInfo_.maxAnisotropy = 1.0f;
    createInfo_.borderColor = VK_BORDER_COLOR_FLOAT_TRANSPARENT_BLACK;
    createInfo_.unnormalizedCoordinates = VK_FALSE;
    createInfo_.compareEnable = VK_FALSE;
    createInfo_.compareOp = VK_COMPARE_OP_ALWAYS;
    createInfo_.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
    createInfo_.mipLodBias = 0.0f;
    createInfo_.minLod = 0.0f;
    createInfo_.maxLod = 0.0f;
}

Sampler::Builder& Sampler::Builder::filter(VkFilter filt) {
    createInfo_.minFilter = filt;
    createInfo_.magFilter = filt;
    return *this;
}

Sampler::Builder& Sampler::Builder::addressMode(VkSamplerAddressMode u, VkSamplerAddressMode v) {
    createInfo_.addressModeU = u;
    createInfo_.addressModeV = v;
    createInfo_.addressModeW = u;
    return *this;
}

Sampler::Builder& Sampler::Builder::borderColor(VkBorderColor color) {
    createInfo_.borderColor = color;
    return *this;
}

SamplerPtr Sampler::Builder::build() {
    VkSampler vkSampler;
    VkResult result = vkCreateSampler(device_->handle(), &createInfo_, nullptr, &vkSampler);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create sampler", result);
    }

    auto sampler = SamplerPtr(new Sampler());
    sampler->device_ = device_;
    sampler->sampler_ = vkSampler;
    return sampler;
}

// ============================================================================
// Sampler implementation
// ============================================================================

Sampler::Builder Sampler::create(LogicalDevice* device) {
    return Builder(device);
}

Sampler::~Sampler() {
    if (sampler_ != VK_NULL_HANDLE) {
        vkDestroySampler(device_->handle(), sampler_, nullptr);
    }
}

} // namespace fine2d
