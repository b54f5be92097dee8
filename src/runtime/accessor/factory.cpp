/**
 * @file factory.cpp
 * @brief Accessor factory and root wrapping.
 */

#include "structured_view/factory.hpp"
#include "structured_view/log.hpp"

#include <sstream>

namespace structured_view {

RootAccessor::RootAccessor(LayoutPtr layout, std::unique_ptr<ViewBank> backing,
                           size_t base_offset)
    : layout_(std::move(layout))
    , wrapped_(wrap_layout(layout_))
    , backing_(std::move(backing))
    , base_offset_(base_offset)
    , wrapper_(make_accessor(*backing_, base_offset_, *wrapped_))
{
}

AccessorFactory::AccessorFactory(const TypeDesc& desc)
    : AccessorFactory(desc, Config{})
{
}

AccessorFactory::AccessorFactory(const TypeDesc& desc, const Config& config)
    : config_(config)
    , layout_(compute_layout(desc))
{
    if (config_.trace) {
        logx::info("factory layout %s", describe(*layout_).c_str());
    }
}

RootAccessor AccessorFactory::create(void* data, size_t byte_length, size_t base_offset) const {
    if (!data) {
        byte_length = 0;
    }
    if (base_offset > byte_length || layout_->min_byte_size > byte_length - base_offset) {
        std::ostringstream oss;
        oss << "Accessor requires " << layout_->min_byte_size << " bytes past "
            << base_offset << ", but buffer is " << byte_length << " bytes";
        throw AccessError(oss.str());
    }

    if (config_.trace) {
        logx::info("create: buffer=%zu bytes base_offset=%zu", byte_length, base_offset);
    }

    return RootAccessor(layout_, std::make_unique<ViewBank>(data, byte_length), base_offset);
}

}  // namespace structured_view
