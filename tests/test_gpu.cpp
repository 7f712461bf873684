#include <gtest/gtest.h>
#include "matprod/compute/ComputeContext.hpp"
#include "matprod/compute/HybridMultiply.hpp"
#include "matprod/compute/accelerator/AcceleratorMultiply.hpp"
#include "matprod/compute/cpu/RowMultiply.hpp"
#include "matprod/core/DebugTrace.hpp"
#include <iostream>
#include <memory>

using namespace matprod;

// Runs against whatever accelerator plugin discovery finds (the CUDA plugin
// when it was built). Skipped on machines without a device.
class GpuTest : public ::testing::Test {
protected:
    void SetUp() override {
        device = ComputeContext::instance().accelerator();
        if (!device) {
            GTEST_SKIP() << "GPU not available";
        }
        std::cout << "[INFO] Using " << device->info().to_string() << std::endl;
        config = ComputeContext::instance().config();
    }

    std::shared_ptr<AcceleratorDevice> device;
    AcceleratorConfig config;
    RowMultiply row;
};

TEST_F(GpuTest, DeviceInfoIsPopulated) {
    const DeviceInfo& info = device->info();
    EXPECT_TRUE(info.available);
    EXPECT_FALSE(info.vendor.empty());
    EXPECT_FALSE(info.name.empty());
    EXPECT_GT(info.compute_units, 0u);
    EXPECT_GT(info.global_memory_bytes, 0u);
    EXPECT_GT(device->free_memory_bytes(), 0u);
}

TEST_F(GpuTest, KnownProduct) {
    AcceleratorMultiply strategy(device, config);
    Matrix c = strategy.multiply(Matrix::from_rows({{1, 2}, {3, 4}}), Matrix::from_rows({{5, 6}, {7, 8}}));
    EXPECT_TRUE(c == Matrix::from_rows({{19, 22}, {43, 50}})) << c.to_string();
}

TEST_F(GpuTest, MatchesRowStrategy) {
    AcceleratorMultiply strategy(device, config);
    // Sizes that are not multiples of the 16x16 kernel tile
    Matrix a = Matrix::random(301, 199, -100, 100, 1);
    Matrix b = Matrix::random(199, 257, -100, 100, 2);
    EXPECT_TRUE(strategy.multiply(a, b) == row.multiply(a, b));
}

TEST_F(GpuTest, OverflowWrapsLikeCpu) {
    AcceleratorMultiply strategy(device, config);
    Matrix a = Matrix::random(64, 64, 1 << 20, 1 << 24, 3);
    Matrix b = Matrix::random(64, 64, 1 << 20, 1 << 24, 4);
    EXPECT_TRUE(strategy.multiply(a, b) == row.multiply(a, b));
}

TEST_F(GpuTest, ChunkedMatchesRowStrategy) {
    config.max_matrix_dim = 256;
    config.max_chunk_dim = 128;
    AcceleratorMultiply strategy(device, config);
    Matrix a = Matrix::random(600, 300, -100, 100, 5);
    Matrix b = Matrix::random(300, 500, -100, 100, 6);
    Matrix c = strategy.multiply(a, b);
    EXPECT_EQ(debug_trace::get_last(), "accelerator.chunked");
    EXPECT_TRUE(c == row.multiply(a, b));
}

TEST_F(GpuTest, HybridSplitMatchesRowStrategy) {
    HybridConfig hybrid_config;
    hybrid_config.cpu_threshold = 64;
    HybridMultiply hybrid(std::make_unique<AcceleratorMultiply>(device, config), nullptr, hybrid_config);
    Matrix a = Matrix::random(300, 150, -100, 100, 7);
    Matrix b = Matrix::random(150, 200, -100, 100, 8);
    Matrix c = hybrid.multiply(a, b);
    EXPECT_EQ(debug_trace::get_last(), "hybrid.split");
    EXPECT_TRUE(c == row.multiply(a, b));
    EXPECT_FALSE(hybrid.accelerator_failed());
}

TEST_F(GpuTest, DoubleDispose) {
    AcceleratorMultiply strategy(device, config);
    strategy.dispose();
    EXPECT_NO_THROW(strategy.dispose());
}
