#include <gtest/gtest.h>
#include "matprod/compute/ComputeContext.hpp"
#include "matprod/compute/HybridMultiply.hpp"
#include "matprod/compute/StrategySelector.hpp"
#include "matprod/compute/accelerator/AcceleratorMultiply.hpp"
#include "matprod/core/Exceptions.hpp"
#include "support/EmulatedAccelerator.hpp"
#include <memory>
#include <stdexcept>

using namespace matprod;
using matprod::test_support::EmulatedAccelerator;

namespace {

AcceleratorConfig cpu_only_config() {
    AcceleratorConfig config;
    config.enable_gpu = false;
    return config;
}

} // namespace

TEST(StrategySelectorTest, ParseKeys) {
    EXPECT_EQ(StrategySelector::parse_key("row"), StrategyKind::Row);
    EXPECT_EQ(StrategySelector::parse_key("f"), StrategyKind::Row);
    EXPECT_EQ(StrategySelector::parse_key("Column"), StrategyKind::Column);
    EXPECT_EQ(StrategySelector::parse_key("c"), StrategyKind::Column);
    EXPECT_EQ(StrategySelector::parse_key("blocked"), StrategyKind::Blocked);
    EXPECT_EQ(StrategySelector::parse_key("CPU"), StrategyKind::Blocked);
    EXPECT_EQ(StrategySelector::parse_key("b"), StrategyKind::Blocked);
    EXPECT_EQ(StrategySelector::parse_key("accelerator"), StrategyKind::Accelerator);
    EXPECT_EQ(StrategySelector::parse_key("gpu"), StrategyKind::Accelerator);
    EXPECT_EQ(StrategySelector::parse_key("G"), StrategyKind::Accelerator);
    EXPECT_EQ(StrategySelector::parse_key("hybrid"), StrategyKind::Hybrid);
    EXPECT_EQ(StrategySelector::parse_key("h"), StrategyKind::Hybrid);
}

TEST(StrategySelectorTest, KeyNamesAreCanonicalKeys) {
    for (StrategyKind kind : {StrategyKind::Row, StrategyKind::Column, StrategyKind::Blocked,
                              StrategyKind::Accelerator, StrategyKind::Hybrid}) {
        EXPECT_EQ(StrategySelector::parse_key(StrategySelector::key_name(kind)), kind);
    }
    EXPECT_EQ(StrategySelector::key_name(StrategyKind::Blocked), "blocked");
}

TEST(StrategySelectorTest, UnknownKeyIsInvalidArgument) {
    ComputeContext context(cpu_only_config());
    StrategySelector selector(context);
    EXPECT_THROW(StrategySelector::parse_key("strassen"), std::invalid_argument);
    EXPECT_THROW(selector.create(""), std::invalid_argument);
    EXPECT_THROW(selector.acquire("x"), std::invalid_argument);
}

TEST(StrategySelectorTest, CpuKeys) {
    ComputeContext context(cpu_only_config());
    StrategySelector selector(context);
    EXPECT_EQ(selector.create("row")->name(), "row");
    EXPECT_EQ(selector.create("column")->name(), "column");
    EXPECT_EQ(selector.create("blocked")->name(), "blocked");
}

TEST(StrategySelectorTest, NoDeviceFallsBackToCpu) {
    ComputeContext context(cpu_only_config());
    StrategySelector selector(context);
    EXPECT_FALSE(context.is_gpu_active());

    auto accelerator = selector.create("accelerator");
    EXPECT_EQ(accelerator->name(), "blocked");
    EXPECT_FALSE(accelerator->is_gpu());

    auto hybrid = selector.create("hybrid");
    ASSERT_EQ(hybrid->name(), "hybrid");
    EXPECT_FALSE(static_cast<HybridMultiply&>(*hybrid).has_accelerator());

    Matrix a = Matrix::from_rows({{1, 2}, {3, 4}});
    Matrix b = Matrix::from_rows({{5, 6}, {7, 8}});
    Matrix expected = Matrix::from_rows({{19, 22}, {43, 50}});
    EXPECT_TRUE(accelerator->multiply(a, b) == expected);
    EXPECT_TRUE(hybrid->multiply(a, b) == expected);
}

TEST(StrategySelectorTest, MissingPluginMeansNoDevice) {
    AcceleratorConfig config;
    config.plugin_libraries = {"libmatprod_plugin_that_does_not_exist.so"};
    ComputeContext context(config);
    EXPECT_EQ(context.accelerator(), nullptr);
    EXPECT_FALSE(context.is_gpu_active());
    EXPECT_FALSE(context.device_info().available);
    EXPECT_EQ(context.device_info().to_string(), "no accelerator");

    StrategySelector selector(context);
    EXPECT_EQ(selector.create("gpu")->name(), "blocked");
}

TEST(StrategySelectorTest, InjectedDeviceIsUsed) {
    auto device = std::make_shared<EmulatedAccelerator>();
    ComputeContext context(device, AcceleratorConfig());
    StrategySelector selector(context);

    EXPECT_TRUE(context.is_gpu_active());
    EXPECT_EQ(context.device_info().vendor, "Emulated");

    auto accelerator = selector.create("accelerator");
    EXPECT_EQ(accelerator->name(), "accelerator");
    EXPECT_TRUE(accelerator->is_gpu());

    auto hybrid = selector.create("hybrid");
    EXPECT_TRUE(static_cast<HybridMultiply&>(*hybrid).has_accelerator());
    EXPECT_TRUE(hybrid->is_gpu());

    Matrix a = Matrix::random(12, 7, -10, 10, 1);
    Matrix b = Matrix::random(7, 9, -10, 10, 2);
    EXPECT_TRUE(accelerator->multiply(a, b) == selector.create("row")->multiply(a, b));
    EXPECT_GE(device->matmul_calls.load(), 1);
}

TEST(StrategySelectorTest, QueueFailureFallsBackToCpu) {
    auto device = std::make_shared<EmulatedAccelerator>();
    device->fail_create_queue = true;
    ComputeContext context(device, AcceleratorConfig());
    StrategySelector selector(context);
    EXPECT_EQ(selector.create("accelerator")->name(), "blocked");
    EXPECT_FALSE(static_cast<HybridMultiply&>(*selector.create("hybrid")).has_accelerator());
}

TEST(StrategySelectorTest, AcquireCachesPerKind) {
    ComputeContext context(cpu_only_config());
    StrategySelector selector(context);
    auto first = selector.acquire("row");
    auto alias = selector.acquire("F");
    auto other = selector.acquire("column");
    EXPECT_EQ(first.get(), alias.get());
    EXPECT_NE(first.get(), other.get());
}

TEST(StrategySelectorTest, CleanupDisposesCachedInstances) {
    auto device = std::make_shared<EmulatedAccelerator>();
    ComputeContext context(device, AcceleratorConfig());
    StrategySelector selector(context);

    auto accelerator = selector.acquire("accelerator");
    selector.cleanup();
    EXPECT_EQ(device->queues_closed.load(), 1);
    EXPECT_TRUE(static_cast<AcceleratorMultiply&>(*accelerator).disposed());

    auto fresh = selector.acquire("accelerator");
    EXPECT_NE(fresh.get(), accelerator.get());
    EXPECT_EQ(device->queues_created.load(), 2);

    // Calling cleanup twice is harmless
    selector.cleanup();
    selector.cleanup();
    EXPECT_EQ(device->queues_closed.load(), 2);
}

TEST(StrategySelectorTest, EveryKeyAgreesOnKnownProduct) {
    auto device = std::make_shared<EmulatedAccelerator>();
    ComputeContext context(device, AcceleratorConfig());
    StrategySelector selector(context);

    Matrix a = Matrix::from_rows({{1, 2}, {3, 4}});
    Matrix b = Matrix::from_rows({{5, 6}, {7, 8}});
    Matrix expected = Matrix::from_rows({{19, 22}, {43, 50}});
    for (const char* key : {"row", "column", "blocked", "accelerator", "hybrid"}) {
        EXPECT_TRUE(selector.acquire(key)->multiply(a, b) == expected) << key;
        EXPECT_THROW(selector.acquire(key)->multiply(Matrix::zeros(2, 3), Matrix::zeros(4, 5)), DimensionMismatch) << key;
    }
}

TEST(StrategySelectorTest, FreeFunctionMultiply) {
    Matrix a = Matrix::from_rows({{1, 2}, {3, 4}});
    Matrix b = Matrix::from_rows({{5, 6}, {7, 8}});
    EXPECT_TRUE(matprod::multiply("row", a, b) == Matrix::from_rows({{19, 22}, {43, 50}}));
    EXPECT_TRUE(matprod::multiply("blocked", a, b) == Matrix::from_rows({{19, 22}, {43, 50}}));
    EXPECT_THROW(matprod::multiply("nope", a, b), std::invalid_argument);
}
