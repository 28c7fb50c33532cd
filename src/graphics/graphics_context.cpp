#include "fine2d/graphics/graphics_context.hpp"
#include "fine2d/graphics/canvas.hpp"
#include "fine2d/graphics/image.hpp"
#include "fine2d/graphics/sampler_cache.hpp"
#include "fine2d/graphics/texture.hpp"
#include "fine2d/core/instance.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/buffer.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/device/command.hpp"
#include "fine2d/rendering/descriptors.hpp"
#include "fine2d/rendering/framebuffer.hpp"
#include "fine2d/rendering/pipeline.hpp"
#include "fine2d/rendering/renderpass.hpp"
#include "fine2d/rendering/swapchain.hpp"
#include "fine2d/rendering/sync.hpp"
#include "fine2d/window/window.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <cstring>

namespace fine2d {

namespace {

const uint32_t BASIC_VERT_SPV[] =
#include "basic.vert.inc"
;

const uint32_t BASIC_FRAG_SPV[] =
#include "basic.frag.inc"
;

constexpr VkDeviceSize INITIAL_INSTANCE_CAPACITY = 1024;
constexpr VkDeviceSize INITIAL_UNIFORM_STREAM_SIZE = 16 * 1024;
constexpr uint32_t MAX_TEXTURE_DESCRIPTORS = 4096;
constexpr uint32_t MVP_PUSH_CONSTANT_SIZE = sizeof(Matrix4);

VkDeviceSize alignUp(VkDeviceSize value, VkDeviceSize alignment) {
    return alignment == 0 ? value : (value + alignment - 1) / alignment * alignment;
}

VkClearColorValue linearClearValue(const Color& color) {
    Color linear = color.toLinear();
    VkClearColorValue value{};
    value.float32[0] = linear.r;
    value.float32[1] = linear.g;
    value.float32[2] = linear.b;
    value.float32[3] = linear.a;
    return value;
}

} // namespace

// ============================================================================
// Creation
// ============================================================================

GraphicsContext::GraphicsContext(const Conf& conf)
    : conf_(conf), filesystem_(conf.resourceDir) {
}

GraphicsContextPtr GraphicsContext::create(const Conf& conf) {
    auto ctx = GraphicsContextPtr(new GraphicsContext(conf));
    ctx->initialize();
    return ctx;
}

void GraphicsContext::initialize() {
    instance_ = Instance::create()
        .applicationName(conf_.windowSetup.title)
        .enableValidation(conf_.backend.enableValidation)
        .build();

    window_ = Window::create(instance_.get())
        .title(conf_.windowSetup.title)
        .mode(conf_.windowMode)
        .vsync(conf_.windowSetup.vsync)
        .srgb(conf_.windowSetup.srgb)
        .framesInFlight(conf_.backend.framesInFlight)
        .build();

    physical_ = PhysicalDevice::selectBest(*instance_, *window_->surface());
    device_ = physical_.createLogicalDevice()
        .surface(window_->surface())
        .addExtension(VK_KHR_SWAPCHAIN_EXTENSION_NAME)
        .build();

    window_->bindDevice(*device_);
    colorFormat_ = window_->swapChain()->format().format;

    samples_ = clampSamples(conf_.windowSetup.samples);

    // Set 0: the sampled texture. Set 1: an optional user uniform block.
    textureSetLayout_ = DescriptorSetLayout::create(device_.get())
        .combinedImageSampler(0, VK_SHADER_STAGE_FRAGMENT_BIT)
        .build();
    uniformSetLayout_ = DescriptorSetLayout::create(device_.get())
        .dynamicUniformBuffer(0, VK_SHADER_STAGE_FRAGMENT_BIT)
        .build();

    uint32_t framesInFlight = window_->framesInFlight();
    descriptorPool_ = DescriptorPool::create(device_.get())
        .maxSets(MAX_TEXTURE_DESCRIPTORS + framesInFlight * 8)
        .poolSize(VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, MAX_TEXTURE_DESCRIPTORS)
        .poolSize(VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC, framesInFlight * 8)
        .allowFree()
        .build();

    pipelineLayout_ = PipelineLayout::create(device_.get())
        .addDescriptorSetLayout(textureSetLayout_->handle())
        .addDescriptorSetLayout(uniformSetLayout_->handle())
        .addPushConstantRange(VK_SHADER_STAGE_VERTEX_BIT, 0, MVP_PUSH_CONSTANT_SIZE)
        .build();

    vertexShader_ = ShaderModule::fromSPIRV(device_.get(), BASIC_VERT_SPV,
                                            sizeof(BASIC_VERT_SPV) / sizeof(uint32_t));
    shaders_ = std::make_unique<ShaderRegistry>(device_.get(), vertexShader_.get(), pipelineLayout_.get());

    std::vector<BlendMode> allModes = {
        BlendMode::Alpha, BlendMode::Add, BlendMode::Subtract, BlendMode::Invert,
        BlendMode::Multiply, BlendMode::Replace, BlendMode::Lighten, BlendMode::Darken,
        BlendMode::Premultiplied
    };
    ShaderId defaultId = shaders_->add(
        ShaderModule::fromSPIRV(device_.get(), BASIC_FRAG_SPV, sizeof(BASIC_FRAG_SPV) / sizeof(uint32_t)),
        allModes, 0, "default");
    if (defaultId != DEFAULT_SHADER) {
        throw std::logic_error("Default shader must be registered first");
    }

    samplers_ = std::make_unique<SamplerCache>(device_.get());
    samplers_->getOrInsert(defaultSampler_);

    createScreenTargets();
    createFrameSlots();
    createQuad();

    const uint8_t white[4] = {255, 255, 255, 255};
    whiteTexture_ = Texture::fromRgba8(device_.get(), descriptorPool_.get(), textureSetLayout_.get(),
                                       1, 1, white);
    bindWhiteTexture();

    targets_.push_back(nullptr);

    auto fb = window_->framebufferSize();
    float w = static_cast<float>(fb.x);
    float h = static_cast<float>(fb.y);
    setProjectionRect(Rect(w * 0.5f, h * 0.5f, w, h));
    calculateTransformMatrix();
    updateGlobals();

    FINE2D_INFO(LogCategory::Render, "Graphics context ready: " + rendererInfo() + ", " +
                std::to_string(static_cast<int>(samples_)) + "x MSAA, " +
                std::to_string(framesInFlight) + " frames in flight");
}

void GraphicsContext::createScreenTargets() {
    SwapChain& swapChain = *window_->swapChain();
    VkExtent2D extent = swapChain.extent();

    if (!screenPass_) {
        screenPass_ = RenderPass::createResume(device_.get(), colorFormat_, samples_,
                                               VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);
    }

    ImageView* msaaView = nullptr;
    msaaImage_.reset();
    if (samples_ > VK_SAMPLE_COUNT_1_BIT) {
        msaaImage_ = DeviceImage::createMultisampleTarget(device_.get(), extent.width, extent.height,
                                                          colorFormat_, samples_);
        msaaImage_->transition(commandPool(), VK_IMAGE_LAYOUT_UNDEFINED,
                               VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);
        msaaView = msaaImage_->view();
    }

    screenFramebuffers_ = Framebuffer::forSwapChain(device_.get(), screenPass_.get(), swapChain, msaaView);
}

void GraphicsContext::createFrameSlots() {
    uint32_t count = window_->framesInFlight();
    frames_.resize(count);
    for (auto& frame : frames_) {
        frame.commands = commandPool()->allocate();
        frame.inFlight = std::make_unique<Fence>(device_.get(), true);
        frame.imageAvailable = std::make_unique<Semaphore>(device_.get());
        frame.renderFinished = std::make_unique<Semaphore>(device_.get());
        frame.instances = Buffer::createStreamBuffer(device_.get(),
            INITIAL_INSTANCE_CAPACITY * sizeof(InstanceProperties),
            VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
        allocateUniformStream(frame, INITIAL_UNIFORM_STREAM_SIZE);
    }
}

void GraphicsContext::createQuad() {
    const Vertex vertices[4] = {
        {{-0.5f, -0.5f}, {0.0f, 0.0f}, {1.0f, 1.0f, 1.0f, 1.0f}},
        {{ 0.5f, -0.5f}, {1.0f, 0.0f}, {1.0f, 1.0f, 1.0f, 1.0f}},
        {{ 0.5f,  0.5f}, {1.0f, 1.0f}, {1.0f, 1.0f, 1.0f, 1.0f}},
        {{-0.5f,  0.5f}, {0.0f, 1.0f}, {1.0f, 1.0f, 1.0f, 1.0f}},
    };
    const uint32_t indices[6] = {0, 1, 2, 0, 2, 3};

    quadVertices_ = Buffer::createVertexBuffer(device_.get(), sizeof(vertices));
    quadVertices_->upload(vertices, sizeof(vertices), commandPool());
    quadIndices_ = Buffer::createIndexBuffer(device_.get(), sizeof(indices));
    quadIndices_->upload(indices, sizeof(indices), commandPool());
}

void GraphicsContext::allocateUniformStream(FrameSlot& frame, VkDeviceSize size) {
    if (frame.uniformSet != VK_NULL_HANDLE) {
        frame.retiredSets.push_back(frame.uniformSet);
    }
    if (frame.uniforms) {
        frame.retained.push_back(frame.uniforms);
    }

    frame.uniforms = Buffer::createStreamBuffer(device_.get(), size, VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT);
    frame.uniformCursor = 0;
    frame.uniformSet = descriptorPool_->allocate(uniformSetLayout_.get());
    DescriptorWriter(device_.get())
        .writeBuffer(frame.uniformSet, 0, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC,
                     frame.uniforms->handle(), 0, MAX_UNIFORM_BLOCK_SIZE)
        .update();
    ++uniformGeneration_;
}

GraphicsContext::~GraphicsContext() {
    if (device_) {
        try {
            device_->waitIdle();
        } catch (const RenderError& e) {
            FINE2D_ERROR(LogCategory::Render, std::string("Device lost during shutdown: ") + e.what());
        }
    }

    targets_.clear();
    boundTexture_.reset();
    for (auto& frame : frames_) {
        frame.retained.clear();
    }
    if (window_) {
        window_->releaseDeviceResources();
    }
}

CommandPool* GraphicsContext::commandPool() {
    return device_->defaultCommandPool();
}

RenderPass& GraphicsContext::compatiblePass(VkSampleCountFlagBits samples) {
    auto it = compatiblePasses_.find(samples);
    if (it != compatiblePasses_.end()) {
        return *it->second;
    }
    auto pass = RenderPass::createResume(device_.get(), colorFormat_, samples,
                                         VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
    RenderPass& result = *pass;
    compatiblePasses_.emplace(samples, std::move(pass));
    return result;
}

VkSampleCountFlagBits GraphicsContext::clampSamples(NumSamples requested) const {
    auto wanted = static_cast<VkSampleCountFlagBits>(sampleCount(requested));
    VkSampleCountFlagBits supported = physical_.capabilities().clampSamples(wanted);
    if (supported != wanted) {
        FINE2D_WARN(LogCategory::Render, std::to_string(sampleCount(requested)) +
                    "x MSAA not supported, using " + std::to_string(static_cast<int>(supported)) + "x");
    }
    return supported;
}

// ============================================================================
// Clearing
// ============================================================================

void GraphicsContext::clear() {
    clear(background_);
}

void GraphicsContext::clear(const Color& color) {
    ensurePass();
    slot().commands->clearColorAttachment(linearClearValue(color), passExtent_);
}

// ============================================================================
// Projection and globals
// ============================================================================

void GraphicsContext::setProjectionRect(const Rect& rect) {
    screenRect_ = rect;
    // Passing top as glm's "bottom" puts rect.top() at NDC -1, the top of a Vulkan target
    projection_ = glm::ortho(rect.left(), rect.right(), rect.top(), rect.bottom(), -1.0f, 1.0f);
}

void GraphicsContext::setScreenCoordinates(const Rect& rect) {
    setProjectionRect(rect);
    applyTransformations();
}

void GraphicsContext::calculateTransformMatrix() {
    pendingMvp_ = projection_ * views_.top() * transforms_.top();
}

void GraphicsContext::updateGlobals() {
    committedMvp_ = pendingMvp_;
}

void GraphicsContext::applyTransformations() {
    calculateTransformMatrix();
    updateGlobals();
}

// ============================================================================
// Instances
// ============================================================================

InstanceProperties* GraphicsContext::reserveInstances(uint32_t count) {
    ensureRecording();
    FrameSlot& frame = slot();

    VkDeviceSize capacity = frame.instances->size() / sizeof(InstanceProperties);
    if (frame.instanceCursor + count > capacity) {
        VkDeviceSize newCapacity = capacity * 2;
        while (newCapacity < count) {
            newCapacity *= 2;
        }
        frame.retained.push_back(frame.instances);
        frame.instances = Buffer::createStreamBuffer(device_.get(),
            newCapacity * sizeof(InstanceProperties), VK_BUFFER_USAGE_VERTEX_BUFFER_BIT);
        frame.instanceCursor = 0;
        FINE2D_DEBUG(LogCategory::Performance, "Instance stream grown to " +
                     std::to_string(newCapacity) + " records");
    }

    pendingInstanceBuffer_ = frame.instances.get();
    pendingFirstInstance_ = static_cast<uint32_t>(frame.instanceCursor);
    pendingInstanceCount_ = count;

    auto* records = static_cast<InstanceProperties*>(frame.instances->mappedPtr());
    InstanceProperties* first = records + frame.instanceCursor;
    frame.instanceCursor += count;
    return first;
}

void GraphicsContext::updateInstanceProperties(const DrawParam& param) {
    updateInstanceProperties(InstanceProperties::from(param));
}

void GraphicsContext::updateInstanceProperties(const InstanceProperties& properties) {
    *reserveInstances(1) = properties;
}

void GraphicsContext::writeInstances(const std::vector<InstanceProperties>& properties) {
    if (properties.empty()) {
        pendingInstanceCount_ = 0;
        return;
    }
    InstanceProperties* dst = reserveInstances(static_cast<uint32_t>(properties.size()));
    std::memcpy(dst, properties.data(), properties.size() * sizeof(InstanceProperties));
}

// ============================================================================
// Drawing
// ============================================================================

void GraphicsContext::bindTexture(const TextureRef& texture, const SamplerInfo& sampler) {
    if (!texture) {
        throw std::logic_error("bindTexture called with a null texture");
    }
    boundTexture_ = texture;
    boundSampler_ = sampler;
}

void GraphicsContext::bindWhiteTexture() {
    boundTexture_ = whiteTexture_;
    boundSampler_ = defaultSampler_;
}

void GraphicsContext::draw() {
    DrawSlice quad;
    quad.vertices = quadVertices_;
    quad.indices = quadIndices_;
    quad.indexCount = 6;
    draw(quad);
}

void GraphicsContext::draw(const DrawSlice& slice) {
    if (!slice.vertices || !slice.indices) {
        throw std::logic_error("Draw slice without vertex or index buffer");
    }
    if (pendingInstanceCount_ == 0) {
        throw std::logic_error("draw() without instance properties for this frame");
    }

    ensurePass();
    FrameSlot& frame = slot();
    CommandBuffer& cmd = *frame.commands;

    GraphicsPipeline& pipeline = shaders_->pipeline(currentShader_, *passCompatible_, passSamples_);
    cmd.bindPipeline(pipeline);

    Sampler& sampler = samplers_->getOrInsert(boundSampler_);
    cmd.bindDescriptorSets(pipelineLayout_->handle(), 0, {boundTexture_->descriptorSet(sampler)});

    if (shaders_->uniformSize(currentShader_) > 0) {
        const auto& placement = placeUniforms(currentShader_);
        cmd.bindDescriptorSets(pipelineLayout_->handle(), 1, {placement.set}, {placement.offset});
    }

    cmd.pushConstants(pipelineLayout_->handle(), VK_SHADER_STAGE_VERTEX_BIT, 0,
                      MVP_PUSH_CONSTANT_SIZE, &committedMvp_);

    cmd.bindVertexBuffers(0, {slice.vertices->handle(), pendingInstanceBuffer_->handle()}, {0, 0});
    cmd.bindIndexBuffer(*slice.indices, VK_INDEX_TYPE_UINT32);
    cmd.drawIndexed(slice.indexCount, pendingInstanceCount_, 0, 0, pendingFirstInstance_);

    frame.retained.push_back(boundTexture_);
    frame.retained.push_back(slice.vertices);
    frame.retained.push_back(slice.indices);
    ++drawCalls_;
}

const ShaderRegistry::UniformPlacement& GraphicsContext::placeUniforms(ShaderId id) {
    const auto& current = shaders_->uniformPlacement(id);
    if (current.generation == uniformGeneration_) {
        return current;
    }

    FrameSlot& frame = slot();
    VkDeviceSize alignment = physical_.capabilities().properties.limits.minUniformBufferOffsetAlignment;
    VkDeviceSize offset = alignUp(frame.uniformCursor, alignment);
    if (offset + MAX_UNIFORM_BLOCK_SIZE > frame.uniforms->size()) {
        allocateUniformStream(frame, frame.uniforms->size() * 2);
        offset = 0;
    }

    const auto& data = shaders_->uniformData(id);
    frame.uniforms->write(data.data(), data.size(), offset);
    frame.uniformCursor = offset + data.size();

    ShaderRegistry::UniformPlacement placement;
    placement.generation = uniformGeneration_;
    placement.set = frame.uniformSet;
    placement.offset = static_cast<uint32_t>(offset);
    shaders_->setUniformPlacement(id, placement);
    return shaders_->uniformPlacement(id);
}

// ============================================================================
// Shaders and blending
// ============================================================================

BlendMode GraphicsContext::blendMode() const {
    return shaders_->blendMode(currentShader_);
}

void GraphicsContext::setBlendMode(BlendMode mode) {
    shaders_->setBlendMode(currentShader_, mode);
}

void GraphicsContext::useShader(ShaderId id) {
    if (id >= shaders_->size()) {
        throw std::logic_error("Unknown shader id " + std::to_string(id));
    }
    currentShader_ = id;
}

// ============================================================================
// Render targets
// ============================================================================

void GraphicsContext::pushCanvas(const Canvas& canvas) {
    endPass();
    targets_.push_back(canvas.target());
}

void GraphicsContext::popCanvas() {
    if (targets_.size() > 1) {
        endPass();
        targets_.pop_back();
    }
}

void GraphicsContext::popCanvas(const Canvas& canvas) {
    if (targets_.back() != canvas.target()) {
        throw std::logic_error("popCanvas: canvas is not the active render target");
    }
    popCanvas();
}

RenderTargetScope::RenderTargetScope(GraphicsContext& ctx, const Canvas& canvas)
    : ctx_(ctx), canvas_(canvas) {
    ctx_.pushCanvas(canvas_);
}

RenderTargetScope::~RenderTargetScope() {
    if (ctx_.activeTarget() == canvas_.target().get()) {
        ctx_.popCanvas();
    } else {
        FINE2D_ERROR(LogCategory::Render, "RenderTargetScope ended while another target was on top");
    }
}

// ============================================================================
// Frame recording
// ============================================================================

void GraphicsContext::ensureRecording() {
    if (recording_) {
        return;
    }

    FrameSlot& frame = slot();
    frame.inFlight->wait();

    // The GPU is done with everything this slot recorded last time
    frame.retained.clear();
    for (VkDescriptorSet set : frame.retiredSets) {
        descriptorPool_->free(set);
    }
    frame.retiredSets.clear();
    frame.instanceCursor = 0;
    frame.uniformCursor = 0;
    ++uniformGeneration_;
    pendingInstanceCount_ = 0;

    frame.commands->reset();
    frame.commands->begin(VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT);
    recording_ = true;
}

void GraphicsContext::acquireImage() {
    if (resizePending_) {
        resizeViewport();
    }

    FrameSlot& frame = slot();
    for (int attempt = 0; attempt < 3; ++attempt) {
        AcquireResult result = window_->swapChain()->acquireNextImage(frame.imageAvailable->handle());
        if (result.outOfDate) {
            resizeViewport();
            continue;
        }

        imageIndex_ = result.imageIndex;
        imageAcquired_ = true;
        acquireWaitPending_ = true;
        resizePending_ = resizePending_ || result.suboptimal;

        // Previous contents are not kept between frames
        frame.commands->transitionImageLayout(window_->swapChain()->image(imageIndex_),
            VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);
        return;
    }
    throw RenderError("Swap chain remained out of date after recreation", VK_ERROR_OUT_OF_DATE_KHR);
}

void GraphicsContext::ensurePass() {
    ensureRecording();
    if (passActive_) {
        return;
    }

    CommandBuffer& cmd = *slot().commands;
    const CanvasTargetRef& target = targets_.back();
    if (!target) {
        if (!imageAcquired_) {
            acquireImage();
        }
        passExtent_ = window_->swapChain()->extent();
        passSamples_ = samples_;
        cmd.beginRenderPass(screenPass_->handle(), screenFramebuffers_[imageIndex_]->handle(), passExtent_);
    } else {
        passExtent_ = target->extent;
        passSamples_ = target->samples;
        cmd.beginRenderPass(target->renderPass->handle(), target->framebuffer->handle(), passExtent_);
        slot().retained.push_back(target);
    }

    passCompatible_ = &compatiblePass(passSamples_);
    cmd.setViewportAndScissor(passExtent_.width, passExtent_.height);
    passActive_ = true;
}

void GraphicsContext::endPass() {
    if (passActive_) {
        slot().commands->endRenderPass();
        passActive_ = false;
    }
}

void GraphicsContext::submit(bool forPresent) {
    FrameSlot& frame = slot();
    frame.commands->end();

    std::vector<VkSemaphore> waits;
    std::vector<VkPipelineStageFlags> stages;
    if (acquireWaitPending_) {
        waits.push_back(frame.imageAvailable->handle());
        stages.push_back(VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT);
        acquireWaitPending_ = false;
    }

    std::vector<VkSemaphore> signals;
    if (forPresent) {
        signals.push_back(frame.renderFinished->handle());
    }

    frame.inFlight->reset();
    recording_ = false;
    // Instance data lives in the slot's stream buffer, which the next recording reuses
    pendingInstanceCount_ = 0;
    device_->graphicsQueue()->submit(frame.commands->handle(), waits, stages, signals,
                                     frame.inFlight->handle());
}

void GraphicsContext::flush() {
    if (!recording_) {
        return;
    }
    endPass();
    submit(false);
    slot().inFlight->wait();
}

void GraphicsContext::present() {
    ensureRecording();
    if (!imageAcquired_) {
        acquireImage();
    }
    endPass();

    FrameSlot& frame = slot();
    frame.commands->transitionImageLayout(window_->swapChain()->image(imageIndex_),
        VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR);
    submit(true);

    VkResult result = device_->presentQueue()->present(
        window_->swapChain()->handle(), imageIndex_, {frame.renderFinished->handle()});
    imageAcquired_ = false;
    frameIndex_ = (frameIndex_ + 1) % static_cast<uint32_t>(frames_.size());
    ++framesPresented_;

    bool resized = window_->consumeResized();
    if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR || resized || resizePending_) {
        resizeViewport();
    } else if (result != VK_SUCCESS) {
        FINE2D_ERROR(LogCategory::Vulkan, "vkQueuePresentKHR failed");
        throw RenderError("Failed to present swap chain image", result);
    }
}

void GraphicsContext::resizeViewport() {
    if (imageAcquired_) {
        // Framebuffers of the acquired image are still referenced by this frame
        resizePending_ = true;
        return;
    }

    device_->waitIdle();
    window_->recreateSwapChain();
    colorFormat_ = window_->swapChain()->format().format;
    createScreenTargets();
    resizePending_ = false;

    VkExtent2D extent = window_->swapChain()->extent();
    FINE2D_INFO(LogCategory::Render, "Viewport resized to " + std::to_string(extent.width) + "x" +
                std::to_string(extent.height));
}

Image GraphicsContext::screenshot() {
    ensureRecording();
    if (!imageAcquired_) {
        acquireImage();
    }
    flush();

    DeviceImage& screen = window_->swapChain()->image(imageIndex_);
    auto pixels = screen.readback(commandPool(), VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);
    if (isBgraFormat(screen.format())) {
        for (size_t i = 0; i + 3 < pixels.size(); i += 4) {
            std::swap(pixels[i], pixels[i + 2]);
        }
    }
    return Image::fromRgba8(*this, screen.width(), screen.height(), pixels);
}

// ============================================================================
// Window
// ============================================================================

void GraphicsContext::setMode(const WindowMode& mode) {
    window_->setMode(mode);
    conf_.windowMode = mode;
    resizePending_ = true;
}

void GraphicsContext::setFullscreen(bool fullscreen) {
    WindowMode mode = window_->mode();
    mode.fullscreen = fullscreen;
    setMode(mode);
}

bool GraphicsContext::isFullscreen() const {
    return window_->mode().fullscreen;
}

void GraphicsContext::setResolution(uint32_t width, uint32_t height) {
    WindowMode mode = window_->mode();
    mode.width = width;
    mode.height = height;
    setMode(mode);
}

void GraphicsContext::setVsync(bool vsync) {
    window_->setVsync(vsync);
    conf_.windowSetup.vsync = vsync;
    resizePending_ = true;
}

glm::uvec2 GraphicsContext::size() const {
    return window_->size();
}

glm::uvec2 GraphicsContext::drawableSize() const {
    return window_->framebufferSize();
}

std::string GraphicsContext::rendererInfo() const {
    uint32_t api = physical_.capabilities().properties.apiVersion;
    return std::string(physical_.name()) + " (Vulkan " +
           std::to_string(VK_API_VERSION_MAJOR(api)) + "." +
           std::to_string(VK_API_VERSION_MINOR(api)) + "." +
           std::to_string(VK_API_VERSION_PATCH(api)) + ")";
}

// ============================================================================
// Sampling
// ============================================================================

void GraphicsContext::setDefaultFilter(FilterMode mode) {
    defaultSampler_.filter = mode;
    samplers_->getOrInsert(defaultSampler_);
}

} // namespace fine2d
