#include "ocfg/overlay_config.hpp"

#include <spdlog/spdlog.h>

namespace ocfg {

using SharedConfigResult = Result<std::shared_ptr<const OverlayConfig>>;

OverlayConfigCache::OverlayConfigCache(ResolveInputs inputs,
                                       std::shared_ptr<WarningCollector> diagnostics)
    : inputs_(std::move(inputs)), diagnostics_(std::move(diagnostics)) {
    inputs_.diagnostics = diagnostics_.get();
}

SharedConfigResult OverlayConfigCache::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_) {
        return SharedConfigResult::ok(config_);
    }
    return resolveLocked();
}

SharedConfigResult OverlayConfigCache::rescan() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::info("Rescanning overlay configuration below {}", inputs_.root);
    // A failed rescan keeps the previous snapshot
    return resolveLocked();
}

void OverlayConfigCache::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.reset();
}

bool OverlayConfigCache::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_ != nullptr;
}

SharedConfigResult OverlayConfigCache::resolveLocked() {
    auto created = OverlayConfig::create(inputs_);
    if (created.isErr()) {
        return SharedConfigResult::err(created.error());
    }
    config_ = std::shared_ptr<const OverlayConfig>(std::move(created.value()));
    return SharedConfigResult::ok(config_);
}

} // namespace ocfg
