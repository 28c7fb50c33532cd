#include "fine2d/graphics/sampler_cache.hpp"
#include "fine2d/device/sampler.hpp"
#include "fine2d/core/logging.hpp"

namespace fine2d {

SamplerCache::SamplerCache(LogicalDevice* device)
    : device_(device) {
}

Sampler& SamplerCache::getOrInsert(const SamplerInfo& info) {
    auto it = samplers_.find(info);
    if (it != samplers_.end()) {
        return *it->second;
    }

    auto sampler = Sampler::create(device_)
        .filter(toVkFilter(info.filter))
        .addressMode(toVkAddressMode(info.wrapX), toVkAddressMode(info.wrapY))
        .build();

    FINE2D_DEBUG(LogCategory::Resource, "Created sampler #" + std::to_string(samplers_.size() + 1));

    Sampler& result = *sampler;
    samplers_.emplace(info, std::move(sampler));
    return result;
}

} // namespace fine2d
