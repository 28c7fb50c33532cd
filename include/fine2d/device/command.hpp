#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <vector>
#include <memory>

namespace fine2d {

class LogicalDevice;
class Queue;
class Buffer;
class DeviceImage;
class GraphicsPipeline;

/**
 * @brief Command pool flags
 */
enum class CommandPoolFlags : uint32_t {
    None = 0,
    Transient = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT,
    Resettable = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT
};

inline CommandPoolFlags operator|(CommandPoolFlags a, CommandPoolFlags b) {
    return static_cast<CommandPoolFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

/**
 * @brief Vulkan command pool wrapper
 */
class CommandPool {
public:
    CommandPool(LogicalDevice* device, Queue* queue,
                CommandPoolFlags flags = CommandPoolFlags::Resettable);

    VkCommandPool handle() const { return pool_; }
    LogicalDevice* device() const { return device_; }
    Queue* queue() const { return queue_; }

    /// Allocate a single primary command buffer
    CommandBufferPtr allocate();

    /// Allocate multiple primary command buffers
    std::vector<CommandBufferPtr> allocate(uint32_t count);

    /// Begin an immediate (one-shot) command sequence
    class ImmediateCommands beginImmediate();

    ~CommandPool();

    CommandPool(const CommandPool&) = delete;
    CommandPool& operator=(const CommandPool&) = delete;

private:
    LogicalDevice* device_ = nullptr;
    Queue* queue_ = nullptr;
    VkCommandPool pool_ = VK_NULL_HANDLE;
};

/**
 * @brief Vulkan command buffer wrapper
 *
 * Thin recording API used by the frame loop and by one-shot uploads and
 * readbacks. Layout transitions derive their access masks and pipeline
 * stages from the layouts involved.
 */
class CommandBuffer {
public:
    VkCommandBuffer handle() const { return buffer_; }
    CommandPool* pool() const { return pool_; }

    // Recording
    void begin(VkCommandBufferUsageFlags flags = 0);
    void end();
    void reset();

    // Binding
    void bindPipeline(GraphicsPipeline& pipeline);
    void bindDescriptorSets(
        VkPipelineLayout layout,
        uint32_t firstSet,
        const std::vector<VkDescriptorSet>& sets,
        const std::vector<uint32_t>& dynamicOffsets = {});
    void bindVertexBuffers(
        uint32_t firstBinding,
        const std::vector<VkBuffer>& buffers,
        const std::vector<VkDeviceSize>& offsets);
    void bindIndexBuffer(Buffer& buffer, VkIndexType type, VkDeviceSize offset = 0);

    // Dynamic state
    void setViewportAndScissor(uint32_t width, uint32_t height);

    // Draw commands
    void draw(uint32_t vertexCount, uint32_t instanceCount = 1,
              uint32_t firstVertex = 0, uint32_t firstInstance = 0);
    void drawIndexed(uint32_t indexCount, uint32_t instanceCount = 1,
                     uint32_t firstIndex = 0, int32_t vertexOffset = 0,
                     uint32_t firstInstance = 0);

    void pushConstants(
        VkPipelineLayout layout,
        VkShaderStageFlags stageFlags,
        uint32_t offset,
        uint32_t size,
        const void* data);

    // Render pass
    void beginRenderPass(VkRenderPass renderPass, VkFramebuffer framebuffer, VkExtent2D extent);
    void endRenderPass();

    /// Clear color attachment 0 of the current render pass over the whole extent
    void clearColorAttachment(const VkClearColorValue& color, VkExtent2D extent);

    // Copy operations
    void copyBuffer(Buffer& src, Buffer& dst, VkDeviceSize size,
                    VkDeviceSize srcOffset = 0, VkDeviceSize dstOffset = 0);
    void copyBufferToImage(Buffer& src, VkImage dst, VkExtent2D extent);
    void copyImageToBuffer(VkImage src, VkExtent2D extent, Buffer& dst);

    /// Single-mip color image layout transition
    void transitionImageLayout(VkImage image, VkImageLayout oldLayout, VkImageLayout newLayout);
    void transitionImageLayout(DeviceImage& image, VkImageLayout oldLayout, VkImageLayout newLayout);

    ~CommandBuffer();

    CommandBuffer(const CommandBuffer&) = delete;
    CommandBuffer& operator=(const CommandBuffer&) = delete;

private:
    friend class CommandPool;
    CommandBuffer(CommandPool* pool, VkCommandBuffer buffer);

    CommandPool* pool_ = nullptr;
    VkCommandBuffer buffer_ = VK_NULL_HANDLE;
};

/**
 * @brief Helper for immediate/one-shot command execution
 *
 * Begins recording on construction. submit() ends, submits and waits for the
 * queue. Work that was never submitted is discarded with a warning.
 */
class ImmediateCommands {
public:
    CommandBuffer& cmd() { return *cmd_; }

    void submit();

    ~ImmediateCommands();

    ImmediateCommands(ImmediateCommands&& other) noexcept;
    ImmediateCommands& operator=(ImmediateCommands&&) = delete;
    ImmediateCommands(const ImmediateCommands&) = delete;
    ImmediateCommands& operator=(const ImmediateCommands&) = delete;

private:
    friend class CommandPool;
    ImmediateCommands(CommandPool* pool, CommandBufferPtr cmd);

    CommandPool* pool_ = nullptr;
    CommandBufferPtr cmd_;
    bool submitted_ = false;
};

} // namespace fine2d
