/**
 * @file test_accumulation_window.cpp
 * @brief Unit tests for the accumulation window lifecycle.
 */

#include "../include/training/accumulation_window.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(AccumulationWindowTest, OpensLazilyAndSumsPerGroup) {
    AccumulationWindow window;
    EXPECT_FALSE(window.is_open());

    window.record_gradient(0, 1.5, 2);
    EXPECT_TRUE(window.is_open());
    window.record_gradient(1, 2.0, 2);
    window.record_gradient(0, 0.5, 2);

    EXPECT_EQ(window.local_grad_sqr(), (std::vector<double>{2.0, 2.0}));
}

TEST(AccumulationWindowTest, SinglePassFinalizesImmediately) {
    AccumulationWindow window;
    window.record_gradient(0, 3.0, 1);

    auto result = window.try_finalize(1);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, (std::vector<double>{3.0}));
    EXPECT_FALSE(window.is_open());
    EXPECT_EQ(window.backward_calls(), 0u);
}

TEST(AccumulationWindowTest, SpansConfiguredNumberOfPasses) {
    AccumulationWindow window;
    const size_t accum = 3;

    for (size_t pass = 1; pass < accum; ++pass) {
        window.record_gradient(0, 1.0, 1);
        EXPECT_FALSE(window.try_finalize(accum).has_value());
        EXPECT_TRUE(window.is_open());
        EXPECT_EQ(window.backward_calls(), pass);
    }
    window.record_gradient(0, 1.0, 1);
    auto result = window.try_finalize(accum);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, (std::vector<double>{3.0}));
    EXPECT_FALSE(window.is_open());
    EXPECT_EQ(window.backward_calls(), 0u);

    // The next window starts from scratch
    window.record_gradient(0, 5.0, 1);
    EXPECT_EQ(window.local_grad_sqr(), (std::vector<double>{5.0}));
}

TEST(AccumulationWindowTest, FinalizeWithoutGradientsIsAContractViolation) {
    AccumulationWindow window;
    EXPECT_THROW(window.try_finalize(1), std::logic_error);
}

TEST(AccumulationWindowTest, TooManyPassesIsAContractViolation) {
    AccumulationWindow window;
    window.record_gradient(0, 1.0, 1);
    EXPECT_FALSE(window.try_finalize(3).has_value());
    EXPECT_FALSE(window.try_finalize(3).has_value());
    EXPECT_THROW(window.try_finalize(1), std::logic_error);
}

TEST(AccumulationWindowTest, GroupOutsideWindowThrows) {
    AccumulationWindow window;
    window.record_gradient(0, 1.0, 1);
    EXPECT_THROW(window.record_gradient(1, 1.0, 2), std::out_of_range);
}

TEST(AccumulationWindowTest, ResetDropsPartialWindow) {
    AccumulationWindow window;
    window.record_gradient(0, 1.0, 1);
    EXPECT_FALSE(window.try_finalize(2).has_value());

    window.reset();

    EXPECT_FALSE(window.is_open());
    EXPECT_EQ(window.backward_calls(), 0u);
    EXPECT_THROW(window.local_grad_sqr(), std::logic_error);
}
