#include "../../include/autotrade/engine/instance_registry.hpp"

#include <mutex>

namespace autotrade::engine {

bool InstanceRegistry::add(InstancePtr instance) {
    if (!instance)
        return false;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return instances_.emplace(instance->id(), std::move(instance)).second;
}

bool InstanceRegistry::remove(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return instances_.erase(id) > 0;
}

InstanceRegistry::InstancePtr InstanceRegistry::find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = instances_.find(id);
    return it == instances_.end() ? nullptr : it->second;
}

std::vector<InstanceRegistry::InstancePtr> InstanceRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<InstancePtr> out;
    out.reserve(instances_.size());
    for (const auto& [id, instance] : instances_) {
        out.push_back(instance);
    }
    return out;
}

std::vector<std::string> InstanceRegistry::ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& entry : instances_) {
        out.push_back(entry.first);
    }
    return out;
}

size_t InstanceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return instances_.size();
}

// =============================================================================
// Control surface
// =============================================================================

bool InstanceRegistry::enable(const std::string& id) {
    auto instance = find(id);
    return instance ? instance->enable() : false;
}

bool InstanceRegistry::disable(const std::string& id, const std::string& reason) {
    auto instance = find(id);
    return instance ? instance->disable(reason) : false;
}

bool InstanceRegistry::restart(const std::string& id) {
    auto instance = find(id);
    return instance ? instance->restart() : false;
}

std::optional<InstanceStatus> InstanceRegistry::get_status(const std::string& id) const {
    auto instance = find(id);
    if (!instance)
        return std::nullopt;
    return instance->get_status();
}

std::optional<PortfolioSnapshot> InstanceRegistry::get_portfolio_snapshot(const std::string& id) {
    auto instance = find(id);
    if (!instance)
        return std::nullopt;
    return instance->get_portfolio_snapshot();
}

std::optional<std::string> InstanceRegistry::add_strategy(const std::string& id, const std::string& symbol,
                                                          strategy::StrategyKind kind,
                                                          const strategy::StrategyParams& params) {
    auto instance = find(id);
    if (!instance)
        return std::nullopt;
    return instance->add_strategy(symbol, kind, params);
}

bool InstanceRegistry::remove_strategy(const std::string& id, const std::string& assignment_id) {
    auto instance = find(id);
    return instance ? instance->remove_strategy(assignment_id) : false;
}

void InstanceRegistry::disable_all(const std::string& reason) {
    for (auto& instance : list()) {
        instance->disable(reason);
    }
}

} // namespace autotrade::engine
