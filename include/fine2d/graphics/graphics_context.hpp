#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/core/conf.hpp"
#include "fine2d/core/filesystem.hpp"
#include "fine2d/device/physical_device.hpp"
#include "fine2d/graphics/types.hpp"
#include "fine2d/graphics/matrix_stack.hpp"
#include "fine2d/graphics/shader.hpp"

#include <vulkan/vulkan.h>
#include <glm/glm.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fine2d {

class Canvas;
class Image;
class SamplerCache;
struct CanvasTarget;
using CanvasTargetRef = std::shared_ptr<CanvasTarget>;

/**
 * @brief Geometry for one draw call
 *
 * Vertices are Vertex records, indices are 32-bit.
 */
struct DrawSlice {
    BufferRef vertices;
    BufferRef indices;
    uint32_t indexCount = 0;
};

/**
 * @brief Per-window graphics state and the draw pipeline
 *
 * Owns the Vulkan instance and device, the window binding, the frame slots,
 * pipelines, shared quad geometry, sampler cache, shader registry, matrix
 * stacks and the render target stack.
 *
 * Recording starts lazily with the first clear or draw of a frame and ends
 * with present(). Render passes are begun on demand on whichever target is
 * on top of the target stack.
 *
 * @code
 * auto ctx = GraphicsContext::create(conf);
 * auto player = Image::load(*ctx, "/player.png");
 * while (ctx->window().isOpen()) {
 *     ctx->window().pollEvents();
 *     ctx->clear(Color::BLACK);
 *     player.draw(*ctx, {400, 300});
 *     ctx->present();
 * }
 * @endcode
 */
class GraphicsContext {
public:
    static GraphicsContextPtr create(const Conf& conf);

    // ========================================================================
    // Clearing
    // ========================================================================

    /// Clear the active render target to the background color
    void clear();
    void clear(const Color& color);

    void setBackgroundColor(const Color& color) { background_ = color; }
    const Color& backgroundColor() const { return background_; }

    // ========================================================================
    // Projection
    // ========================================================================

    /**
     * @brief Orthographic projection over a centre-based rect
     *
     * rect.top() maps to the top edge of the target and Y grows downwards.
     * Takes effect after applyTransformations().
     */
    void setProjectionRect(const Rect& rect);

    void setProjection(const Matrix4& projection) { projection_ = projection; }
    const Matrix4& projection() const { return projection_; }

    /// Premultiply the projection: projection = m * projection
    void transformProjection(const Matrix4& m) { projection_ = m * projection_; }

    /// The rect last given to setProjectionRect
    const Rect& screenCoordinates() const { return screenRect_; }

    /// setProjectionRect followed by applyTransformations
    void setScreenCoordinates(const Rect& rect);

    // ========================================================================
    // Transform and view stacks
    // ========================================================================

    void pushTransform(std::optional<Matrix4> transform = std::nullopt) { transforms_.push(transform); }
    void popTransform() { transforms_.pop(); }
    void setTransform(const Matrix4& transform) { transforms_.set(transform); }
    const Matrix4& transform() const { return transforms_.top(); }
    void applyTransform(const Matrix4& transform) { transforms_.apply(transform); }
    void origin() { transforms_.origin(); }
    size_t transformDepth() const { return transforms_.depth(); }

    void pushView(std::optional<Matrix4> view = std::nullopt) { views_.push(view); }
    void popView() { views_.pop(); }
    void setView(const Matrix4& view) { views_.set(view); }
    const Matrix4& view() const { return views_.top(); }
    void applyView(const Matrix4& view) { views_.apply(view); }
    size_t viewDepth() const { return views_.depth(); }

    /// Recompute projection * view * transform into the pending globals
    void calculateTransformMatrix();

    /// Make the pending globals the ones later draws use
    void updateGlobals();

    /// calculateTransformMatrix() then updateGlobals()
    void applyTransformations();

    /// MVP used by draws
    const Matrix4& globals() const { return committedMvp_; }

    // ========================================================================
    // Drawing
    // ========================================================================

    /// Write one instance record; the next draw() uses it
    void updateInstanceProperties(const DrawParam& param);
    void updateInstanceProperties(const InstanceProperties& properties);

    /// Write a contiguous run of records; the next draw() instances over all of them
    void writeInstances(const std::vector<InstanceProperties>& properties);

    /// Texture and sampler the next draw samples
    void bindTexture(const TextureRef& texture, const SamplerInfo& sampler);

    /// Sample the 1x1 white texture (untextured meshes)
    void bindWhiteTexture();

    /// Draw the shared unit quad
    void draw();
    void draw(const DrawSlice& slice);

    /// Draw calls recorded since the context was created
    uint64_t drawCallCount() const { return drawCalls_; }

    // ========================================================================
    // Shaders and blending
    // ========================================================================

    /// Blend mode of the current shader
    BlendMode blendMode() const;

    /// Set the current shader's blend mode; RenderError if the shader does not allow it
    void setBlendMode(BlendMode mode);

    void useShader(ShaderId id);
    ShaderId currentShader() const { return currentShader_; }

    ShaderRegistry& shaders() { return *shaders_; }
    const ShaderRegistry& shaders() const { return *shaders_; }

    // ========================================================================
    // Render targets
    // ========================================================================

    /// Redirect drawing into a canvas until the matching pop
    void pushCanvas(const Canvas& canvas);

    /// Return to the previous target; no-op when the screen is on top
    void popCanvas();

    /// Pop a specific canvas; std::logic_error if it is not on top
    void popCanvas(const Canvas& canvas);

    /// Canvas on top of the target stack, nullptr for the screen
    const CanvasTarget* activeTarget() const { return targets_.back().get(); }

    /// Number of targets including the screen
    size_t targetDepth() const { return targets_.size(); }

    // ========================================================================
    // Frames
    // ========================================================================

    /// Recreate the swap chain, framebuffers and multisample image at the window's size
    void resizeViewport();

    /// Submit the frame and present it
    void present();

    /// Submit recorded work and wait for it
    void flush();

    uint32_t frameIndex() const { return frameIndex_; }
    uint64_t framesPresented() const { return framesPresented_; }

    /// Copy of the current screen contents
    Image screenshot();

    // ========================================================================
    // Window
    // ========================================================================

    /// Apply a new window mode; the swap chain follows at the next frame boundary
    void setMode(const WindowMode& mode);
    void setFullscreen(bool fullscreen);
    bool isFullscreen() const;
    void setResolution(uint32_t width, uint32_t height);
    void setVsync(bool vsync);

    /// Window size in screen coordinates
    glm::uvec2 size() const;

    /// Drawable size in pixels
    glm::uvec2 drawableSize() const;

    /// Device name and Vulkan API version
    std::string rendererInfo() const;

    Window& window() { return *window_; }
    LogicalDevice* device() const { return device_.get(); }
    Filesystem& filesystem() { return filesystem_; }
    const Conf& conf() const { return conf_; }

    // ========================================================================
    // Sampling
    // ========================================================================

    /// Filter new images start with
    void setDefaultFilter(FilterMode mode);
    FilterMode defaultFilter() const { return defaultSampler_.filter; }
    const SamplerInfo& defaultSamplerInfo() const { return defaultSampler_; }

    SamplerCache& samplers() { return *samplers_; }

    // ========================================================================
    // Resources for images and canvases
    // ========================================================================

    /// Color format of the screen and of canvases
    VkFormat colorFormat() const { return colorFormat_; }

    /// Screen sample count after clamping to the device
    VkSampleCountFlagBits screenSamples() const { return samples_; }

    /// Largest supported sample count not above the request
    VkSampleCountFlagBits clampSamples(NumSamples requested) const;

    DescriptorPool* descriptorPool() { return descriptorPool_.get(); }
    DescriptorSetLayout* textureSetLayout() { return textureSetLayout_.get(); }
    CommandPool* commandPool();

    ~GraphicsContext();

    GraphicsContext(const GraphicsContext&) = delete;
    GraphicsContext& operator=(const GraphicsContext&) = delete;

private:
    explicit GraphicsContext(const Conf& conf);

    void initialize();
    void createScreenTargets();
    void createFrameSlots();
    void createQuad();

    /// Pass that pipelines for this sample count are built against
    RenderPass& compatiblePass(VkSampleCountFlagBits samples);

    struct FrameSlot {
        CommandBufferPtr commands;
        FencePtr inFlight;
        SemaphorePtr imageAvailable;
        SemaphorePtr renderFinished;

        BufferRef instances;
        VkDeviceSize instanceCursor = 0;

        BufferRef uniforms;
        VkDeviceSize uniformCursor = 0;
        VkDescriptorSet uniformSet = VK_NULL_HANDLE;
        std::vector<VkDescriptorSet> retiredSets;

        /// Resources recorded work refers to; released when the fence is next waited
        std::vector<std::shared_ptr<void>> retained;
    };

    FrameSlot& slot() { return frames_[frameIndex_]; }

    void ensureRecording();
    void ensurePass();
    void endPass();
    void acquireImage();
    void submit(bool forPresent);

    /// Room for `count` more instance records, growing the stream if needed
    InstanceProperties* reserveInstances(uint32_t count);

    const ShaderRegistry::UniformPlacement& placeUniforms(ShaderId id);
    void allocateUniformStream(FrameSlot& frame, VkDeviceSize size);

    Conf conf_;
    Filesystem filesystem_;

    InstancePtr instance_;
    WindowPtr window_;
    PhysicalDevice physical_;
    LogicalDevicePtr device_;

    VkSampleCountFlagBits samples_ = VK_SAMPLE_COUNT_1_BIT;
    VkFormat colorFormat_ = VK_FORMAT_UNDEFINED;

    DescriptorSetLayoutPtr textureSetLayout_;
    DescriptorSetLayoutPtr uniformSetLayout_;
    DescriptorPoolPtr descriptorPool_;
    PipelineLayoutPtr pipelineLayout_;
    ShaderModulePtr vertexShader_;
    std::unique_ptr<ShaderRegistry> shaders_;
    std::unique_ptr<SamplerCache> samplers_;
    std::map<VkSampleCountFlagBits, RenderPassPtr> compatiblePasses_;

    RenderPassPtr screenPass_;
    DeviceImagePtr msaaImage_;
    std::vector<FramebufferPtr> screenFramebuffers_;

    BufferRef quadVertices_;
    BufferRef quadIndices_;
    TextureRef whiteTexture_;

    std::vector<FrameSlot> frames_;
    uint32_t frameIndex_ = 0;
    uint64_t framesPresented_ = 0;
    uint64_t drawCalls_ = 0;
    uint64_t uniformGeneration_ = 1;

    // Recording state
    bool recording_ = false;
    bool passActive_ = false;
    VkSampleCountFlagBits passSamples_ = VK_SAMPLE_COUNT_1_BIT;
    RenderPass* passCompatible_ = nullptr;
    VkExtent2D passExtent_{};
    bool imageAcquired_ = false;
    bool acquireWaitPending_ = false;
    bool resizePending_ = false;
    uint32_t imageIndex_ = 0;

    std::vector<CanvasTargetRef> targets_;

    MatrixStack transforms_;
    MatrixStack views_;
    Matrix4 projection_{1.0f};
    Rect screenRect_;
    Matrix4 pendingMvp_{1.0f};
    Matrix4 committedMvp_{1.0f};

    Color background_{0.1f, 0.2f, 0.3f, 1.0f};
    SamplerInfo defaultSampler_;
    ShaderId currentShader_ = DEFAULT_SHADER;

    TextureRef boundTexture_;
    SamplerInfo boundSampler_;

    Buffer* pendingInstanceBuffer_ = nullptr;
    uint32_t pendingFirstInstance_ = 0;
    uint32_t pendingInstanceCount_ = 0;
};

/**
 * @brief Pushes a canvas on construction and pops it on destruction
 */
class RenderTargetScope {
public:
    RenderTargetScope(GraphicsContext& ctx, const Canvas& canvas);
    ~RenderTargetScope();

    RenderTargetScope(const RenderTargetScope&) = delete;
    RenderTargetScope& operator=(const RenderTargetScope&) = delete;

private:
    GraphicsContext& ctx_;
    const Canvas& canvas_;
};

} // namespace fine2d
