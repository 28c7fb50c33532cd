#pragma once

#include <memory>
#include <vulkan/vulkan.h>

namespace fine2d {

// Forward declarations
class Instance;
class Surface;
class DebugMessenger;
class PhysicalDevice;
class LogicalDevice;
class Queue;
class Buffer;
class DeviceImage;
class ImageView;
class SwapChain;
class RenderPass;
class GraphicsPipeline;
class PipelineLayout;
class ShaderModule;
class Framebuffer;
class CommandPool;
class CommandBuffer;
class DescriptorSetLayout;
class DescriptorPool;
class Semaphore;
class Fence;
class Sampler;
class Window;
class Texture;
class GraphicsContext;

// Smart pointer typedefs for ownership
using InstancePtr = std::unique_ptr<Instance>;
using SurfacePtr = std::unique_ptr<Surface>;
using DebugMessengerPtr = std::unique_ptr<DebugMessenger>;
using LogicalDevicePtr = std::unique_ptr<LogicalDevice>;
using BufferPtr = std::unique_ptr<Buffer>;
using DeviceImagePtr = std::unique_ptr<DeviceImage>;
using ImageViewPtr = std::unique_ptr<ImageView>;
using SwapChainPtr = std::unique_ptr<SwapChain>;
using RenderPassPtr = std::unique_ptr<RenderPass>;
using GraphicsPipelinePtr = std::unique_ptr<GraphicsPipeline>;
using PipelineLayoutPtr = std::unique_ptr<PipelineLayout>;
using ShaderModulePtr = std::unique_ptr<ShaderModule>;
using FramebufferPtr = std::unique_ptr<Framebuffer>;
using CommandPoolPtr = std::unique_ptr<CommandPool>;
using CommandBufferPtr = std::unique_ptr<CommandBuffer>;
using DescriptorSetLayoutPtr = std::unique_ptr<DescriptorSetLayout>;
using DescriptorPoolPtr = std::unique_ptr<DescriptorPool>;
using SemaphorePtr = std::unique_ptr<Semaphore>;
using FencePtr = std::unique_ptr<Fence>;
using SamplerPtr = std::unique_ptr<Sampler>;
using WindowPtr = std::unique_ptr<Window>;
using GraphicsContextPtr = std::unique_ptr<GraphicsContext>;

// Shared GPU resources that recorded frames may keep alive past their owner
using TextureRef = std::shared_ptr<Texture>;
using BufferRef = std::shared_ptr<Buffer>;

} // namespace fine2d
