#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace fine2d {

class DeviceImage;
class ImageView;
class Sampler;
class DescriptorPool;
class DescriptorSetLayout;

/**
 * @brief Sampled GPU image shared by Image and Canvas handles
 *
 * Owns the device image, its view and one combined image sampler
 * descriptor set per sampler it has been drawn with. Held through
 * TextureRef; recorded frames keep their own reference until the GPU is
 * done with them.
 */
class Texture {
public:
    /// Upload RGBA8 pixels (rows top to bottom) into a new sampled texture
    static TextureRef fromRgba8(LogicalDevice* device, DescriptorPool* pool,
                                DescriptorSetLayout* layout,
                                uint32_t width, uint32_t height, const void* pixels,
                                VkFormat format = VK_FORMAT_R8G8B8A8_SRGB);

    /**
     * @brief A texture that can also be rendered into
     *
     * Contents start transparent black. The image rests in
     * SHADER_READ_ONLY_OPTIMAL between render passes.
     */
    static TextureRef renderTarget(LogicalDevice* device, DescriptorPool* pool,
                                   DescriptorSetLayout* layout,
                                   uint32_t width, uint32_t height, VkFormat format);

    DeviceImage& image() { return *image_; }
    ImageView* view();

    uint32_t width() const;
    uint32_t height() const;
    VkFormat format() const;

    /// Descriptor set binding this texture with a sampler, written on first use
    VkDescriptorSet descriptorSet(Sampler& sampler);

    /// Read back as RGBA8 rows top to bottom; the texture must be idle on the GPU
    std::vector<uint8_t> readRgba8(CommandPool* commandPool);

    ~Texture();

    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;

private:
    Texture(LogicalDevice* device, DescriptorPool* pool, DescriptorSetLayout* layout,
            DeviceImagePtr image);

    LogicalDevice* device_;
    DescriptorPool* pool_;
    DescriptorSetLayout* layout_;
    DeviceImagePtr image_;
    std::unordered_map<VkSampler, VkDescriptorSet> descriptorSets_;
};

/// True for the BGRA orderings the swap chain usually picks
bool isBgraFormat(VkFormat format);

} // namespace fine2d
