#include "matprod/compute/StrategySelector.hpp"
#include "matprod/compute/HybridMultiply.hpp"
#include "matprod/compute/accelerator/AcceleratorMultiply.hpp"
#include "matprod/compute/cpu/ColumnMultiply.hpp"
#include "matprod/compute/cpu/RowMultiply.hpp"
#include "matprod/core/Exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace matprod {

StrategySelector& StrategySelector::instance() {
    static StrategySelector selector(ComputeContext::instance());
    return selector;
}

StrategySelector::StrategySelector(ComputeContext& context, BlockedConfig blocked, HybridConfig hybrid)
    : context_(context), blocked_config_(blocked), hybrid_config_(hybrid) {}

StrategySelector::~StrategySelector() {
    cleanup();
}

StrategyKind StrategySelector::parse_key(const std::string& key) {
    std::string k = key;
    std::transform(k.begin(), k.end(), k.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (k == "row" || k == "f") return StrategyKind::Row;
    if (k == "column" || k == "c") return StrategyKind::Column;
    if (k == "blocked" || k == "cpu" || k == "b") return StrategyKind::Blocked;
    if (k == "accelerator" || k == "gpu" || k == "g") return StrategyKind::Accelerator;
    if (k == "hybrid" || k == "h") return StrategyKind::Hybrid;
    throw std::invalid_argument("Unknown multiplication method: '" + key + "'");
}

std::string StrategySelector::key_name(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Row: return "row";
        case StrategyKind::Column: return "column";
        case StrategyKind::Blocked: return "blocked";
        case StrategyKind::Accelerator: return "accelerator";
        case StrategyKind::Hybrid: return "hybrid";
    }
    return "unknown";
}

std::unique_ptr<MultiplyStrategy> StrategySelector::create_accelerator() {
    auto device = context_.accelerator();
    if (!device) return nullptr;
    try {
        return std::make_unique<AcceleratorMultiply>(device, context_.config());
    } catch (const DeviceUnavailable& e) {
        std::cerr << "[MatProd] Warning: " << e.what() << ". Falling back to CPU." << std::endl;
        return nullptr;
    }
}

std::unique_ptr<MultiplyStrategy> StrategySelector::create(const std::string& key) {
    return create(parse_key(key));
}

std::unique_ptr<MultiplyStrategy> StrategySelector::create(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Row:
            return std::make_unique<RowMultiply>();
        case StrategyKind::Column:
            return std::make_unique<ColumnMultiply>();
        case StrategyKind::Blocked:
            return std::make_unique<BlockedMultiply>(blocked_config_);
        case StrategyKind::Accelerator: {
            auto accelerator = create_accelerator();
            if (accelerator) return accelerator;
            if (context_.config().verbose) {
                std::cerr << "[MatProd] No accelerator; '" << key_name(kind) << "' runs on the '"
                          << key_name(StrategyKind::Blocked) << "' CPU path." << std::endl;
            }
            return std::make_unique<BlockedMultiply>(blocked_config_);
        }
        case StrategyKind::Hybrid:
            return std::make_unique<HybridMultiply>(create_accelerator(),
                                                    std::make_unique<BlockedMultiply>(blocked_config_),
                                                    hybrid_config_);
    }
    throw std::invalid_argument("Unknown strategy kind");
}

std::shared_ptr<MultiplyStrategy> StrategySelector::acquire(const std::string& key) {
    const StrategyKind kind = parse_key(key);
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_.find(kind);
    if (it != cache_.end()) return it->second;

    std::shared_ptr<MultiplyStrategy> strategy = create(kind);
    cache_.emplace(kind, strategy);
    return strategy;
}

void StrategySelector::cleanup() {
    std::map<StrategyKind, std::shared_ptr<MultiplyStrategy>> dropped;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        dropped.swap(cache_);
    }
    for (auto& entry : dropped) {
        entry.second->dispose();
    }
}

Matrix multiply(const std::string& key, const Matrix& a, const Matrix& b) {
    return StrategySelector::instance().acquire(key)->multiply(a, b);
}

void cleanup() {
    StrategySelector::instance().cleanup();
}

} // namespace matprod
