#include "fine2d/graphics/shader.hpp"
#include "fine2d/graphics/graphics_context.hpp"
#include "fine2d/rendering/pipeline.hpp"
#include "fine2d/rendering/renderpass.hpp"
#include "fine2d/core/filesystem.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/error.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>

namespace fine2d {

// ============================================================================
// ShaderRegistry implementation
// ============================================================================

ShaderRegistry::ShaderRegistry(LogicalDevice* device, ShaderModule* vertexShader,
                               PipelineLayout* layout)
    : device_(device), vertexShader_(vertexShader), layout_(layout) {
}

ShaderRegistry::~ShaderRegistry() = default;

ShaderRegistry::Entry& ShaderRegistry::entry(ShaderId id) {
    if (id >= shaders_.size()) {
        throw std::logic_error("Unknown shader id " + std::to_string(id));
    }
    return shaders_[id];
}

const ShaderRegistry::Entry& ShaderRegistry::entry(ShaderId id) const {
    if (id >= shaders_.size()) {
        throw std::logic_error("Unknown shader id " + std::to_string(id));
    }
    return shaders_[id];
}

ShaderId ShaderRegistry::add(ShaderModulePtr fragment, std::vector<BlendMode> blendModes,
                             uint32_t uniformSize, std::string name) {
    if (blendModes.empty()) {
        throw std::logic_error("A shader needs at least one blend mode");
    }
    if (uniformSize > MAX_UNIFORM_BLOCK_SIZE) {
        throw std::logic_error("Uniform block of " + std::to_string(uniformSize) +
                               " bytes exceeds the " + std::to_string(MAX_UNIFORM_BLOCK_SIZE) + " byte limit");
    }

    Entry e;
    e.name = std::move(name);
    e.fragment = std::move(fragment);
    e.blendMode = blendModes.front();
    e.allowed = std::move(blendModes);
    e.uniformSize = uniformSize;
    e.uniformData.assign(uniformSize, 0);
    shaders_.push_back(std::move(e));

    ShaderId id = shaders_.size() - 1;
    FINE2D_DEBUG(LogCategory::Shader, "Registered shader " + std::to_string(id) + " \"" +
                 shaders_.back().name + "\"");
    return id;
}

void ShaderRegistry::setBlendMode(ShaderId id, BlendMode mode) {
    Entry& e = entry(id);
    if (std::find(e.allowed.begin(), e.allowed.end(), mode) == e.allowed.end()) {
        FINE2D_ERROR(LogCategory::Shader, std::string("Blend mode ") + blendModeName(mode) +
                     " not allowed for shader \"" + e.name + "\"");
        throw RenderError(std::string("Shader \"") + e.name + "\" does not support blend mode " +
                          blendModeName(mode));
    }
    e.blendMode = mode;
}

GraphicsPipeline& ShaderRegistry::pipeline(ShaderId id, RenderPass& renderPass,
                                           VkSampleCountFlagBits samples) {
    Entry& e = entry(id);
    auto key = std::make_tuple(e.blendMode, renderPass.handle(), samples);
    auto it = e.pipelines.find(key);
    if (it != e.pipelines.end()) {
        return *it->second;
    }

    auto pipeline = GraphicsPipeline::create(device_, &renderPass, layout_)
        .vertexShader(vertexShader_)
        .fragmentShader(e.fragment.get())
        // Per-vertex: position, uv, color
        .vertexBinding(0, sizeof(Vertex))
        .vertexAttribute(0, 0, VK_FORMAT_R32G32_SFLOAT, offsetof(Vertex, pos))
        .vertexAttribute(1, 0, VK_FORMAT_R32G32_SFLOAT, offsetof(Vertex, uv))
        .vertexAttribute(2, 0, VK_FORMAT_R32G32B32A32_SFLOAT, offsetof(Vertex, color))
        // Per-instance: source rect, model matrix columns, tint
        .vertexBinding(1, sizeof(InstanceProperties), VK_VERTEX_INPUT_RATE_INSTANCE)
        .vertexAttribute(3, 1, VK_FORMAT_R32G32B32A32_SFLOAT, offsetof(InstanceProperties, src))
        .vertexAttribute(4, 1, VK_FORMAT_R32G32B32A32_SFLOAT, offsetof(InstanceProperties, col1))
        .vertexAttribute(5, 1, VK_FORMAT_R32G32B32A32_SFLOAT, offsetof(InstanceProperties, col2))
        .vertexAttribute(6, 1, VK_FORMAT_R32G32B32A32_SFLOAT, offsetof(InstanceProperties, col3))
        .vertexAttribute(7, 1, VK_FORMAT_R32G32B32A32_SFLOAT, offsetof(InstanceProperties, col4))
        .vertexAttribute(8, 1, VK_FORMAT_R32G32B32A32_SFLOAT, offsetof(InstanceProperties, color))
        .samples(samples)
        .blend(toBlendState(e.blendMode))
        .build();

    FINE2D_DEBUG(LogCategory::Shader, "Built pipeline for \"" + e.name + "\" (" +
                 blendModeName(e.blendMode) + ", " + std::to_string(static_cast<int>(samples)) + "x)");

    GraphicsPipeline& result = *pipeline;
    e.pipelines.emplace(key, std::move(pipeline));
    return result;
}

size_t ShaderRegistry::pipelineCount() const {
    size_t count = 0;
    for (const auto& e : shaders_) {
        count += e.pipelines.size();
    }
    return count;
}

void ShaderRegistry::setUniformData(ShaderId id, const void* data, size_t size) {
    Entry& e = entry(id);
    if (size != e.uniformSize) {
        throw std::logic_error("Shader \"" + e.name + "\" expects " + std::to_string(e.uniformSize) +
                               " uniform bytes, got " + std::to_string(size));
    }
    std::memcpy(e.uniformData.data(), data, size);
    e.placement = UniformPlacement{};
}

// ============================================================================
// PixelShader implementation
// ============================================================================

PixelShader PixelShader::fromSpirv(GraphicsContext& ctx, const std::vector<uint32_t>& spirv,
                                   std::vector<BlendMode> blendModes,
                                   uint32_t uniformSize, std::string name) {
    auto module = ShaderModule::fromSPIRV(ctx.device(), spirv);
    ShaderId id = ctx.shaders().add(std::move(module), std::move(blendModes), uniformSize, std::move(name));
    return PixelShader(id);
}

PixelShader PixelShader::fromFile(GraphicsContext& ctx, const std::string& path,
                                  std::vector<BlendMode> blendModes, uint32_t uniformSize) {
    auto bytes = ctx.filesystem().open(path);
    auto module = ShaderModule::fromBytes(ctx.device(), bytes);
    ShaderId id = ctx.shaders().add(std::move(module), std::move(blendModes), uniformSize, path);
    return PixelShader(id);
}

void PixelShader::sendUniforms(GraphicsContext& ctx, const void* data, size_t size) const {
    ctx.shaders().setUniformData(id_, data, size);
}

BlendMode PixelShader::blendMode(const GraphicsContext& ctx) const {
    return ctx.shaders().blendMode(id_);
}

void PixelShader::setBlendMode(GraphicsContext& ctx, BlendMode mode) const {
    ctx.shaders().setBlendMode(id_, mode);
}

// ============================================================================
// ShaderLock implementation
// ============================================================================

ShaderLock::ShaderLock(GraphicsContext& ctx, ShaderId shader)
    : ctx_(&ctx), previous_(ctx.currentShader()) {
    ctx.useShader(shader);
}

ShaderLock::ShaderLock(ShaderLock&& other) noexcept
    : ctx_(other.ctx_), previous_(other.previous_) {
    other.ctx_ = nullptr;
}

ShaderLock::~ShaderLock() {
    if (ctx_) {
        ctx_->useShader(previous_);
    }
}

ShaderLock useShader(GraphicsContext& ctx, const PixelShader& shader) {
    return ShaderLock(ctx, shader.id());
}

} // namespace fine2d
