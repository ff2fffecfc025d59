#pragma once

#include "trading_instance.hpp"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace autotrade {
namespace engine {

/**
 * InstanceRegistry - instance id -> trading instance.
 *
 * Read-mostly: lookups take a shared lock, add/remove an exclusive one.
 * Control calls run outside the lock on a shared_ptr copy, so a slow
 * restart never blocks other lookups.
 *
 * Unknown ids give false / nullopt, never an exception.
 */
class InstanceRegistry {
public:
    using InstancePtr = std::shared_ptr<ITradingInstance>;

    /// @return false if the id is already registered
    bool add(InstancePtr instance);
    bool remove(const std::string& id);

    InstancePtr find(const std::string& id) const;
    std::vector<InstancePtr> list() const;
    std::vector<std::string> ids() const;
    size_t size() const;

    // Control surface
    bool enable(const std::string& id);
    bool disable(const std::string& id, const std::string& reason = "Disabled by operator");
    bool restart(const std::string& id);
    std::optional<InstanceStatus> get_status(const std::string& id) const;
    std::optional<PortfolioSnapshot> get_portfolio_snapshot(const std::string& id);
    std::optional<std::string> add_strategy(const std::string& id, const std::string& symbol,
                                            strategy::StrategyKind kind, const strategy::StrategyParams& params);
    bool remove_strategy(const std::string& id, const std::string& assignment_id);

    /// Disable every instance (shutdown)
    void disable_all(const std::string& reason);

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, InstancePtr> instances_;
};

}  // namespace engine
}  // namespace autotrade
