#include "fine2d/graphics/texture.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/sampler.hpp"
#include "fine2d/rendering/descriptors.hpp"
#include "fine2d/core/logging.hpp"

#include <utility>

namespace fine2d {

bool isBgraFormat(VkFormat format) {
    return format == VK_FORMAT_B8G8R8A8_SRGB || format == VK_FORMAT_B8G8R8A8_UNORM;
}

Texture::Texture(LogicalDevice* device, DescriptorPool* pool, DescriptorSetLayout* layout,
                 DeviceImagePtr image)
    : device_(device), pool_(pool), layout_(layout), image_(std::move(image)) {
}

TextureRef Texture::fromRgba8(LogicalDevice* device, DescriptorPool* pool,
                              DescriptorSetLayout* layout,
                              uint32_t width, uint32_t height, const void* pixels,
                              VkFormat format) {
    auto image = DeviceImage::createTexture2D(device, width, height, format);
    VkDeviceSize size = static_cast<VkDeviceSize>(width) * height * 4;
    image->upload(pixels, size, device->defaultCommandPool(),
                  VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);

    FINE2D_DEBUG(LogCategory::Resource, "Texture uploaded: " + std::to_string(width) + "x" +
                 std::to_string(height));
    return TextureRef(new Texture(device, pool, layout, std::move(image)));
}

TextureRef Texture::renderTarget(LogicalDevice* device, DescriptorPool* pool,
                                 DescriptorSetLayout* layout,
                                 uint32_t width, uint32_t height, VkFormat format) {
    auto image = DeviceImage::createRenderTarget(device, width, height, format);
    std::vector<uint8_t> transparent(static_cast<size_t>(width) * height * 4, 0);
    image->upload(transparent.data(), transparent.size(), device->defaultCommandPool(),
                  VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);

    return TextureRef(new Texture(device, pool, layout, std::move(image)));
}

ImageView* Texture::view() {
    return image_->view();
}

uint32_t Texture::width() const {
    return image_->width();
}

uint32_t Texture::height() const {
    return image_->height();
}

VkFormat Texture::format() const {
    return image_->format();
}

VkDescriptorSet Texture::descriptorSet(Sampler& sampler) {
    auto it = descriptorSets_.find(sampler.handle());
    if (it != descriptorSets_.end()) {
        return it->second;
    }

    VkDescriptorSet set = pool_->allocate(layout_);
    DescriptorWriter(device_)
        .writeImage(set, 0, image_->view(), &sampler)
        .update();

    descriptorSets_.emplace(sampler.handle(), set);
    return set;
}

std::vector<uint8_t> Texture::readRgba8(CommandPool* commandPool) {
    auto pixels = image_->readback(commandPool, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
    if (isBgraFormat(image_->format())) {
        for (size_t i = 0; i + 3 < pixels.size(); i += 4) {
            std::swap(pixels[i], pixels[i + 2]);
        }
    }
    return pixels;
}

Texture::~Texture() {
    for (auto& entry : descriptorSets_) {
        pool_->free(entry.second);
    }
}

} // namespace fine2d
