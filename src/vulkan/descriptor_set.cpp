#include <vkbind/descriptor_set.hpp>
#include <vkbind/descriptor_pool.hpp>
#include <vkbind/descriptor_set_layout.hpp>
#include <vkbind/descriptor_writer.hpp>

#include <string>
#include <utility>

namespace vkbind {

DescriptorSet::~DescriptorSet() {
    if (set_ == VK_NULL_HANDLE) return;
    // A destroyed pool already freed the set along with itself.
    if (auto pool = pool_.lock()) {
        pool->freeSet(set_, layout_->desc().poolSizes());
    }
}

Result<std::shared_ptr<DescriptorSet>> DescriptorSet::create(
    const std::shared_ptr<DescriptorPool>& pool,
    std::shared_ptr<const DescriptorSetLayout> layout,
    std::vector<DescriptorWrite> init) {
    if (!pool || !layout) {
        return Error{"create descriptor set", 0, "pool and layout are required",
                     ErrorKind::InvalidArgument};
    }

    auto decoded = layout->desc().decodeInit(std::move(init));
    if (!decoded.ok()) return decoded.error();

    auto withinLimits = checkLimits(decoded.value(), pool->limits());
    if (!withinLimits.ok()) return withinLimits.error();

    auto allocated = pool->allocate(*layout);
    if (!allocated.ok()) return allocated.error();

    std::shared_ptr<DescriptorSet> set(new DescriptorSet());
    set->pool_   = pool;
    set->layout_ = std::move(layout);
    set->limits_ = pool->limits();
    set->device_ = pool->vkDevice();
    set->set_    = allocated.value();

    DescriptorWriter(set->set_).add(decoded.value()).write(set->device_);
    set->record(std::move(decoded).value());

    return set;
}

Result<std::shared_ptr<DescriptorSet>> DescriptorSet::create(
    const std::shared_ptr<DescriptorPool>& pool,
    std::shared_ptr<const DescriptorSetLayout> layout,
    DescriptorBindings init) {
    std::vector<DescriptorWrite> writes;
    writes.reserve(init.size());
    for (auto& [binding, content] : init) {
        writes.push_back(DescriptorWrite{binding, 0, std::move(content)});
    }
    return create(pool, std::move(layout), std::move(writes));
}

Result<void> DescriptorSet::update(std::vector<DescriptorWrite> writes) {
    if (!usable()) {
        return Error{"update descriptor set", 0,
                     "the pool this set was allocated from has been destroyed",
                     ErrorKind::InvalidArgument};
    }

    auto decoded = layout_->desc().decodeWrite(std::move(writes));
    if (!decoded.ok()) return decoded.error();

    auto withinLimits = checkLimits(decoded.value(), limits_);
    if (!withinLimits.ok()) return withinLimits.error();

    DescriptorWriter(set_).add(decoded.value()).write(device_);
    record(std::move(decoded).value());
    return {};
}

Result<void> DescriptorSet::update(DescriptorBindings writes) {
    std::vector<DescriptorWrite> out;
    out.reserve(writes.size());
    for (auto& [binding, content] : writes) {
        out.push_back(DescriptorWrite{binding, 0, std::move(content)});
    }
    return update(std::move(out));
}

const DescriptorBind* DescriptorSet::boundResource(std::uint32_t binding,
                                                   std::uint32_t arrayElement) const {
    auto it = resources_.find({binding, arrayElement});
    return it == resources_.end() ? nullptr : &it->second;
}

Result<void> DescriptorSet::checkLimits(const std::vector<DescriptorWrite>& writes,
                                        const DeviceLimits& limits) {
    for (const auto& w : writes) {
        auto r = w.content.validateLimits(limits);
        if (!r.ok()) {
            Error e = r.error();
            e.message = "binding " + std::to_string(w.binding) + "[" +
                        std::to_string(w.arrayElement) + "]: " + e.message;
            return e;
        }
    }
    return {};
}

void DescriptorSet::record(std::vector<DescriptorWrite> writes) {
    for (auto& w : writes) {
        resources_[{w.binding, w.arrayElement}] = std::move(w.content);
    }
}

} // namespace vkbind
