#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/graphics/types.hpp"

#include <unordered_map>

namespace fine2d {

/**
 * @brief Vulkan samplers keyed by SamplerInfo, created on first use and never evicted
 */
class SamplerCache {
public:
    explicit SamplerCache(LogicalDevice* device);

    Sampler& getOrInsert(const SamplerInfo& info);

    size_t size() const { return samplers_.size(); }

private:
    LogicalDevice* device_;
    std::unordered_map<SamplerInfo, SamplerPtr> samplers_;
};

} // namespace fine2d
