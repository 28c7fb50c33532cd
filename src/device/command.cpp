#include "fine2d/device/command.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/buffer.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/rendering/pipeline.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/error.hpp"

namespace fine2d {

namespace {

void layoutAccess(VkImageLayout layout, bool asSource,
                  VkAccessFlags& access, VkPipelineStageFlags& stage) {
    switch (layout) {
        case VK_IMAGE_LAYOUT_UNDEFINED:
            access = 0;
            stage = asSource ? VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT
                             : VK_PIPELINE_STAGE_ALL_COMMANDS_BIT;
            break;
        case VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL:
            access = VK_ACCESS_TRANSFER_WRITE_BIT;
            stage = VK_PIPELINE_STAGE_TRANSFER_BIT;
            break;
        case VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL:
            access = VK_ACCESS_TRANSFER_READ_BIT;
            stage = VK_PIPELINE_STAGE_TRANSFER_BIT;
            break;
        case VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL:
            access = VK_ACCESS_SHADER_READ_BIT;
            stage = VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT;
            break;
        case VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL:
            access = VK_ACCESS_COLOR_ATTACHMENT_READ_BIT | VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
            stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
            break;
        case VK_IMAGE_LAYOUT_PRESENT_SRC_KHR:
            access = 0;
            stage = asSource ? VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT
                             : VK_PIPELINE_STAGE_BOTTOM_OF_PIPE_BIT;
            break;
        default:
            access = VK_ACCESS_MEMORY_READ_BIT | VK_ACCESS_MEMORY_WRITE_BIT;
            stage = VK_PIPELINE_STAGE_ALL_COMMANDS_BIT;
            break;
    }
}

} // namespace

// ============================================================================
// CommandPool implementation
// ============================================================================

CommandPool::CommandPool(LogicalDevice* device, Queue* queue, CommandPoolFlags flags)
    : device_(device), queue_(queue) {

    VkCommandPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    poolInfo.queueFamilyIndex = queue->familyIndex();
    poolInfo.flags = static_cast<VkCommandPoolCreateFlags>(flags);

    VkResult result = vkCreateCommandPool(device_->handle(), &poolInfo, nullptr, &pool_);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create command pool", result);
    }
}

CommandPool::~CommandPool() {
    if (pool_ != VK_NULL_HANDLE) {
        vkDestroyCommandPool(device_->handle(), pool_, nullptr);
    }
}

CommandBufferPtr CommandPool::allocate() {
    auto buffers = allocate(1);
    return std::move(buffers.front());
}

std::vector<CommandBufferPtr> CommandPool::allocate(uint32_t count) {
    VkCommandBufferAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    allocInfo.commandPool = pool_;
    allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    allocInfo.commandBufferCount = count;

    std::vector<VkCommandBuffer> buffers(count);
    VkResult result = vkAllocateCommandBuffers(device_->handle(), &allocInfo, buffers.data());
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to allocate command buffers", result);
    }

    std::vector<CommandBufferPtr> cmdBuffers;
    cmdBuffers.reserve(count);
    for (auto buffer : buffers) {
        cmdBuffers.push_back(CommandBufferPtr(new CommandBuffer(this, buffer)));
    }
    return cmdBuffers;
}

ImmediateCommands CommandPool::beginImmediate() {
    auto cmd = allocate();
    cmd->begin(VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT);
    return ImmediateCommands(this, std::move(cmd));
}

// ============================================================================
// CommandBuffer implementation
// ============================================================================

CommandBuffer::CommandBuffer(CommandPool* pool, VkCommandBuffer buffer)
    : pool_(pool), buffer_(buffer) {
}

CommandBuffer::~CommandBuffer() {
    if (buffer_ != VK_NULL_HANDLE) {
        vkFreeCommandBuffers(pool_->device()->handle(), pool_->handle(), 1, &buffer_);
    }
}

void CommandBuffer::begin(VkCommandBufferUsageFlags flags) {
    VkCommandBufferBeginInfo beginInfo{};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = flags;

    VkResult result = vkBeginCommandBuffer(buffer_, &beginInfo);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to begin recording command buffer", result);
    }
}

void CommandBuffer::end() {
    VkResult result = vkEndCommandBuffer(buffer_);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to end command buffer recording", result);
    }
}

void CommandBuffer::reset() {
    VkResult result = vkResetCommandBuffer(buffer_, 0);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to reset command buffer", result);
    }
}

void CommandBuffer::bindPipeline(GraphicsPipeline& pipeline) {
    vkCmdBindPipeline(buffer_, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline.handle());
}

void CommandBuffer::bindDescriptorSets(
    VkPipelineLayout layout,
    uint32_t firstSet,
    const std::vector<VkDescriptorSet>& sets,
    const std::vector<uint32_t>& dynamicOffsets) {

    vkCmdBindDescriptorSets(
        buffer_, VK_PIPELINE_BIND_POINT_GRAPHICS, layout, firstSet,
        static_cast<uint32_t>(sets.size()), sets.data(),
        static_cast<uint32_t>(dynamicOffsets.size()),
        dynamicOffsets.empty() ? nullptr : dynamicOffsets.data());
}

void CommandBuffer::bindVertexBuffers(
    uint32_t firstBinding,
    const std::vector<VkBuffer>& buffers,
    const std::vector<VkDeviceSize>& offsets) {

    vkCmdBindVertexBuffers(
        buffer_, firstBinding,
        static_cast<uint32_t>(buffers.size()),
        buffers.data(), offsets.data());
}

void CommandBuffer::bindIndexBuffer(Buffer& buffer, VkIndexType type, VkDeviceSize offset) {
    vkCmdBindIndexBuffer(buffer_, buffer.handle(), offset, type);
}

void CommandBuffer::setViewportAndScissor(uint32_t width, uint32_t height) {
    VkViewport viewport{};
    viewport.x = 0.0f;
    viewport.y = 0.0f;
    viewport.width = static_cast<float>(width);
    viewport.height = static_cast<float>(height);
    viewport.minDepth = 0.0f;
    viewport.maxDepth = 1.0f;
    vkCmdSetViewport(buffer_, 0, 1, &viewport);

    VkRect2D scissor{};
    scissor.offset = {0, 0};
    scissor.extent = {width, height};
    vkCmdSetScissor(buffer_, 0, 1, &scissor);
}

void CommandBuffer::draw(uint32_t vertexCount, uint32_t instanceCount,
                         uint32_t firstVertex, uint32_t firstInstance) {
    vkCmdDraw(buffer_, vertexCount, instanceCount, firstVertex, firstInstance);
}

void CommandBuffer::drawIndexed(uint32_t indexCount, uint32_t instanceCount,
                                uint32_t firstIndex, int32_t vertexOffset,
                                uint32_t firstInstance) {
    vkCmdDrawIndexed(buffer_, indexCount, instanceCount, firstIndex, vertexOffset, firstInstance);
}

void CommandBuffer::pushConstants(
    VkPipelineLayout layout,
    VkShaderStageFlags stageFlags,
    uint32_t offset,
    uint32_t size,
    const void* data) {
    vkCmdPushConstants(buffer_, layout, stageFlags, offset, size, data);
}

void CommandBuffer::beginRenderPass(VkRenderPass renderPass, VkFramebuffer framebuffer,
                                    VkExtent2D extent) {
    // Every attachment loads, so no clear values are needed
    VkRenderPassBeginInfo renderPassInfo{};
    renderPassInfo.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    renderPassInfo.renderPass = renderPass;
    renderPassInfo.framebuffer = framebuffer;
    renderPassInfo.renderArea.offset = {0, 0};
    renderPassInfo.renderArea.extent = extent;

    vkCmdBeginRenderPass(buffer_, &renderPassInfo, VK_SUBPASS_CONTENTS_INLINE);
}

void CommandBuffer::endRenderPass() {
    vkCmdEndRenderPass(buffer_);
}

void CommandBuffer::clearColorAttachment(const VkClearColorValue& color, VkExtent2D extent) {
    VkClearAttachment attachment{};
    attachment.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    attachment.colorAttachment = 0;
    attachment.clearValue.color = color;

    VkClearRect rect{};
    rect.rect.offset = {0, 0};
    rect.rect.extent = extent;
    rect.baseArrayLayer = 0;
    rect.layerCount = 1;

    vkCmdClearAttachments(buffer_, 1, &attachment, 1, &rect);
}

void CommandBuffer::copyBuffer(Buffer& src, Buffer& dst, VkDeviceSize size,
                               VkDeviceSize srcOffset, VkDeviceSize dstOffset) {
    VkBufferCopy copyRegion{};
    copyRegion.srcOffset = srcOffset;
    copyRegion.dstOffset = dstOffset;
    copyRegion.size = size;
    vkCmdCopyBuffer(buffer_, src.handle(), dst.handle(), 1, &copyRegion);
}

void CommandBuffer::copyBufferToImage(Buffer& src, VkImage dst, VkExtent2D extent) {
    VkBufferImageCopy region{};
    region.imageSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    region.imageSubresource.layerCount = 1;
    region.imageExtent = {extent.width, extent.height, 1};

    vkCmdCopyBufferToImage(buffer_, src.handle(), dst,
                           VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);
}

void CommandBuffer::copyImageToBuffer(VkImage src, VkExtent2D extent, Buffer& dst) {
    VkBufferImageCopy region{};
    region.imageSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    region.imageSubresource.layerCount = 1;
    region.imageExtent = {extent.width, extent.height, 1};

    vkCmdCopyImageToBuffer(buffer_, src, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                           dst.handle(), 1, &region);
}

void CommandBuffer::transitionImageLayout(VkImage image, VkImageLayout oldLayout,
                                          VkImageLayout newLayout) {
    VkImageMemoryBarrier barrier{};
    barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
    barrier.oldLayout = oldLayout;
    barrier.newLayout = newLayout;
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.image = image;
    barrier.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
    barrier.subresourceRange.baseMipLevel = 0;
    barrier.subresourceRange.levelCount = 1;
    barrier.subresourceRange.baseArrayLayer = 0;
    barrier.subresourceRange.layerCount = 1;

    VkPipelineStageFlags sourceStage;
    VkPipelineStageFlags destinationStage;
    layoutAccess(oldLayout, true, barrier.srcAccessMask, sourceStage);
    layoutAccess(newLayout, false, barrier.dstAccessMask, destinationStage);

    vkCmdPipelineBarrier(
        buffer_,
        sourceStage, destinationStage,
        0,
        0, nullptr,
        0, nullptr,
        1, &barrier);
}

void CommandBuffer::transitionImageLayout(DeviceImage& image, VkImageLayout oldLayout,
                                          VkImageLayout newLayout) {
    transitionImageLayout(image.handle(), oldLayout, newLayout);
}

// ============================================================================
// ImmediateCommands implementation
// ============================================================================

ImmediateCommands::ImmediateCommands(CommandPool* pool, CommandBufferPtr cmd)
    : pool_(pool), cmd_(std::move(cmd)) {
}

ImmediateCommands::~ImmediateCommands() {
    if (cmd_ && !submitted_) {
        FINE2D_WARN(LogCategory::Vulkan, "Immediate commands discarded without submit");
    }
}

ImmediateCommands::ImmediateCommands(ImmediateCommands&& other) noexcept
    : pool_(other.pool_)
    , cmd_(std::move(other.cmd_))
    , submitted_(other.submitted_) {
    other.submitted_ = true;
}

void ImmediateCommands::submit() {
    if (submitted_) {
        return;
    }
    submitted_ = true;

    cmd_->end();

    VkSubmitInfo submitInfo{};
    submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submitInfo.commandBufferCount = 1;
    VkCommandBuffer buffer = cmd_->handle();
    submitInfo.pCommandBuffers = &buffer;

    pool_->queue()->submit(submitInfo);
    pool_->queue()->waitIdle();
}

} // namespace fine2d
