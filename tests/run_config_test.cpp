//
// Created by Giuseppe Francione on 11/12/25.
//

#include <gtest/gtest.h>
#include "run_config.hpp"
#include <stdexcept>

using namespace pixtrim;

class RunConfigTest : public ::testing::Test {
protected:
    RunConfig config;

    void SetUp() override {
        config.input_root = "images";
    }
};

TEST_F(RunConfigTest, DefaultsAreValid) {
    EXPECT_NO_THROW(config.validate());
    EXPECT_TRUE(config.in_place());
    EXPECT_EQ(config.quality, 85);
    EXPECT_EQ(config.png_zopfli, ZopfliPolicy::Budgeted);
}

TEST_F(RunConfigTest, QualityOutOfRange) {
    config.quality = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);
    config.quality = 101;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST_F(RunConfigTest, ZeroMaxEdgeIsRejected) {
    config.max_edge_px = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST_F(RunConfigTest, EmptyInputIsRejected) {
    config.input_root.clear();
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST_F(RunConfigTest, ZopfliPolicyNames) {
    EXPECT_EQ(to_string(ZopfliPolicy::Never), "never");
    EXPECT_EQ(to_string(ZopfliPolicy::Budgeted), "auto");
    EXPECT_EQ(to_string(ZopfliPolicy::Always), "always");
}
