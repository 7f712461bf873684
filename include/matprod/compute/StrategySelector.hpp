#pragma once

#include "matprod/compute/ComputeContext.hpp"
#include "matprod/compute/MultiplyStrategy.hpp"
#include "matprod/compute/WorkloadPartitioner.hpp"
#include "matprod/compute/cpu/BlockedMultiply.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace matprod {

enum class StrategyKind {
    Row,
    Column,
    Blocked,
    Accelerator,
    Hybrid
};

/**
 * @brief Maps method keys to multiply strategies.
 *
 * Keys are case-insensitive: "row"/"f", "column"/"c", "blocked"/"cpu"/"b",
 * "accelerator"/"gpu"/"g" and "hybrid"/"h". Without an accelerator the
 * accelerator key yields a BlockedMultiply and the hybrid key a CPU-only
 * HybridMultiply, so a lookup never fails for lack of a device.
 */
class StrategySelector {
public:
    // Process default, bound to ComputeContext::instance().
    static StrategySelector& instance();

    explicit StrategySelector(ComputeContext& context,
                              BlockedConfig blocked = BlockedConfig::from_environment(),
                              HybridConfig hybrid = HybridConfig());
    ~StrategySelector();

    StrategySelector(const StrategySelector&) = delete;
    StrategySelector& operator=(const StrategySelector&) = delete;

    // @throws std::invalid_argument for an unknown key.
    static StrategyKind parse_key(const std::string& key);
    static std::string key_name(StrategyKind kind);

    // A fresh instance owned by the caller.
    std::unique_ptr<MultiplyStrategy> create(const std::string& key);
    std::unique_ptr<MultiplyStrategy> create(StrategyKind kind);

    // The instance cached for this key, created on first use.
    std::shared_ptr<MultiplyStrategy> acquire(const std::string& key);

    // Dispose and drop every cached instance.
    void cleanup();

    ComputeContext& context() { return context_; }

private:
    std::unique_ptr<MultiplyStrategy> create_accelerator();

    ComputeContext& context_;
    BlockedConfig blocked_config_;
    HybridConfig hybrid_config_;

    std::mutex cache_mutex_;
    std::map<StrategyKind, std::shared_ptr<MultiplyStrategy>> cache_;
};

// multiply(key, A, B) through the process default selector.
Matrix multiply(const std::string& key, const Matrix& a, const Matrix& b);

// Release every cached strategy of the process default selector.
void cleanup();

} // namespace matprod
