#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/graphics/types.hpp"

#include <vulkan/vulkan.h>
#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace fine2d {

class RenderPass;

/// Dense index of a registered shader
using ShaderId = size_t;

/// The built-in textured quad shader
constexpr ShaderId DEFAULT_SHADER = 0;

/// Largest user uniform block a pixel shader may declare
constexpr uint32_t MAX_UNIFORM_BLOCK_SIZE = 1024;

/**
 * @brief Fragment shaders with their blend state and lazily built pipelines
 *
 * All shaders share one vertex shader and one pipeline layout. A pipeline
 * exists per (blend mode, render pass, sample count) and is created the
 * first time a draw needs it.
 */
class ShaderRegistry {
public:
    ShaderRegistry(LogicalDevice* device, ShaderModule* vertexShader, PipelineLayout* layout);

    /**
     * @brief Register a fragment shader
     *
     * The first allowed mode is the initial blend mode. Throws
     * std::logic_error for an empty mode list or an oversized uniform block.
     */
    ShaderId add(ShaderModulePtr fragment, std::vector<BlendMode> blendModes,
                 uint32_t uniformSize, std::string name);

    size_t size() const { return shaders_.size(); }

    const std::string& name(ShaderId id) const { return entry(id).name; }

    BlendMode blendMode(ShaderId id) const { return entry(id).blendMode; }

    /// Throws RenderError when the mode is not one the shader was registered with
    void setBlendMode(ShaderId id, BlendMode mode);

    const std::vector<BlendMode>& allowedBlendModes(ShaderId id) const { return entry(id).allowed; }

    uint32_t uniformSize(ShaderId id) const { return entry(id).uniformSize; }

    /// Pipeline for the shader's current blend mode, built on first use
    GraphicsPipeline& pipeline(ShaderId id, RenderPass& renderPass, VkSampleCountFlagBits samples);

    /// Number of pipelines built so far
    size_t pipelineCount() const;

    // ========================================================================
    // User uniforms
    // ========================================================================

    /// Latest uniform bytes sent to a shader (zero-filled until the first send)
    void setUniformData(ShaderId id, const void* data, size_t size);
    const std::vector<uint8_t>& uniformData(ShaderId id) const { return entry(id).uniformData; }

    /**
     * @brief Where the uniform data currently lives in a frame's uniform stream
     *
     * A placement is valid for one stream generation only; new data or a new
     * generation forces another copy.
     */
    struct UniformPlacement {
        uint64_t generation = 0;
        VkDescriptorSet set = VK_NULL_HANDLE;
        uint32_t offset = 0;
    };
    const UniformPlacement& uniformPlacement(ShaderId id) const { return entry(id).placement; }
    void setUniformPlacement(ShaderId id, const UniformPlacement& placement) { entry(id).placement = placement; }

    ~ShaderRegistry();

    ShaderRegistry(const ShaderRegistry&) = delete;
    ShaderRegistry& operator=(const ShaderRegistry&) = delete;

private:
    struct Entry {
        std::string name;
        ShaderModulePtr fragment;
        std::vector<BlendMode> allowed;
        BlendMode blendMode = BlendMode::Alpha;
        uint32_t uniformSize = 0;
        std::vector<uint8_t> uniformData;
        UniformPlacement placement;
        std::map<std::tuple<BlendMode, VkRenderPass, VkSampleCountFlagBits>, GraphicsPipelinePtr> pipelines;
    };

    Entry& entry(ShaderId id);
    const Entry& entry(ShaderId id) const;

    LogicalDevice* device_;
    ShaderModule* vertexShader_;
    PipelineLayout* layout_;
    std::vector<Entry> shaders_;
};

/**
 * @brief User handle to a registered pixel shader
 *
 * @code
 * auto shader = PixelShader::fromFile(ctx, "/shaders/dim.frag.spv",
 *                                     {BlendMode::Alpha}, sizeof(DimUniforms));
 * shader.sendUniforms(ctx, &dim, sizeof(dim));
 * {
 *     ShaderLock lock = useShader(ctx, shader);
 *     image.drawEx(ctx, param);
 * }
 * @endcode
 */
class PixelShader {
public:
    /// Register a fragment shader from SPIR-V words
    static PixelShader fromSpirv(GraphicsContext& ctx, const std::vector<uint32_t>& spirv,
                                 std::vector<BlendMode> blendModes = {BlendMode::Alpha},
                                 uint32_t uniformSize = 0, std::string name = "pixel shader");

    /// Register a compiled .spv file read through the context's Filesystem
    static PixelShader fromFile(GraphicsContext& ctx, const std::string& path,
                                std::vector<BlendMode> blendModes = {BlendMode::Alpha},
                                uint32_t uniformSize = 0);

    ShaderId id() const { return id_; }

    /// Copy new uniform values; later draws with this shader see them
    void sendUniforms(GraphicsContext& ctx, const void* data, size_t size) const;

    BlendMode blendMode(const GraphicsContext& ctx) const;
    void setBlendMode(GraphicsContext& ctx, BlendMode mode) const;

private:
    explicit PixelShader(ShaderId id) : id_(id) {}

    ShaderId id_;
};

/**
 * @brief Makes a shader current and restores the previous one when destroyed
 */
class ShaderLock {
public:
    ShaderLock(GraphicsContext& ctx, ShaderId shader);
    ~ShaderLock();

    ShaderLock(ShaderLock&& other) noexcept;
    ShaderLock& operator=(ShaderLock&&) = delete;
    ShaderLock(const ShaderLock&) = delete;
    ShaderLock& operator=(const ShaderLock&) = delete;

    ShaderId previous() const { return previous_; }

private:
    GraphicsContext* ctx_;
    ShaderId previous_;
};

ShaderLock useShader(GraphicsContext& ctx, const PixelShader& shader);

} // namespace fine2d
