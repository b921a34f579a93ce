/**
 * @file test_adascale.cpp
 * @brief Unit tests for the AdaScale controller.
 *
 * Most tests use a single worker accumulating two passes (scale 2, two
 * gradient samples) with smoothing 0, so that every valid window sets the
 * averages to its exact estimate. With per-pass gradients 3 and 1 the local
 * squared norm is 10, the total 16 / 4 = 4, which gives a variance of 2 and
 * a squared norm of 3.
 */

#include "../include/logger.hpp"
#include "../include/optimizer/adam.hpp"
#include "../include/optimizer/sgd.hpp"
#include "../include/training/adascale.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <map>
#include <stdexcept>

namespace {
class RecordingWriter : public SummaryWriter {
  public:
    struct Record {
        double value;
        double step;
    };

    void add_scalar(const std::string& tag, double value, double step) override {
        records[tag] = Record{value, step};
        count++;
    }

    std::map<std::string, Record> records;
    size_t count = 0;
};

class FailingOptimizer : public SGD {
  public:
    using SGD::SGD;
    void step() override {
        throw std::runtime_error("step failed");
    }
};
} // namespace

class AdaScaleTest : public ::testing::Test {
  protected:
    void SetUp() override {
        optimizer.add_param_group(std::vector<Parameter*>{&weights});
    }

    static AutoScalerConfig make_config() {
        AutoScalerConfig config;
        config.world_size = 1;
        config.num_gradients_to_accumulate = 2;
        config.scale_one_world_size = 1;
        config.smoothing = 0.0f;
        config.gradient_noise_scale.scale_one_batch_size = 32;
        config.gradient_noise_scale.batch_size_upper_limit = 4096;
        return config;
    }

    /// One accumulation window of two backward passes
    void run_window(BackwardEngine& eng, Parameter& param, float first, float second) {
        eng.backward({{&param, Matrix(1, 1, first)}});
        eng.backward({{&param, Matrix(1, 1, second)}});
    }

    void run_window(float first, float second) {
        run_window(engine, weights, first, second);
    }

    void iterate(AdaScale& adascale, float first = 3.0f, float second = 1.0f) {
        run_window(first, second);
        adascale.step();
        adascale.get_step_increment();
        adascale.zero_grad();
    }

    Parameter weights{"weights", 1, 1};
    SGD optimizer{0.1f, 0.0f};
    BackwardEngine engine;
};

TEST_F(AdaScaleTest, WindowProducesExactEstimate) {
    AdaScale adascale(optimizer, engine, make_config());
    EXPECT_EQ(adascale.scale(), 2u);
    EXPECT_TRUE(adascale.gain_invalid());

    run_window(3.0f, 1.0f);

    EXPECT_FALSE(adascale.gain_invalid());
    EXPECT_FALSE(adascale.is_window_open());
    EXPECT_EQ(adascale.last_total_grad_sqr(), (std::vector<double>{4.0}));
    EXPECT_NEAR(adascale.last_estimate().grad_var[0], 2.0, 1e-12);
    EXPECT_NEAR(adascale.last_estimate().grad_sqr[0], 3.0, 1e-12);
    EXPECT_NEAR(adascale.grad_var_avg(), 2.0, 1e-12);
    EXPECT_NEAR(adascale.grad_sqr_avg(0), 3.0, 1e-12);
}

TEST_F(AdaScaleTest, GainScalesLearningRateForOneStep) {
    AdaScale adascale(optimizer, engine, make_config());
    run_window(3.0f, 1.0f);

    EXPECT_NEAR(adascale.gain(), 5.0 / 4.0, 1e-12);
    EXPECT_TRUE(adascale.step());

    // lr 0.1 * gain 1.25 * accumulated gradient 4
    EXPECT_NEAR(weights.value(0, 0), -0.5f, 1e-6);
    EXPECT_FLOAT_EQ(optimizer.hyperparameters(0).learning_rate, 0.1f);
    EXPECT_NEAR(adascale.effective_lr(), 0.125f, 1e-7);
}

TEST_F(AdaScaleTest, InvalidSampleLeavesLearningRateAlone) {
    AdaScale adascale(optimizer, engine, make_config());
    // Identical passes carry no variance
    run_window(2.0f, 2.0f);

    EXPECT_TRUE(adascale.gain_invalid());
    EXPECT_EQ(adascale.gain(), 1.0);
    adascale.step();
    EXPECT_NEAR(weights.value(0, 0), -0.4f, 1e-6);
}

TEST_F(AdaScaleTest, UnadjustedAccumulationIsRescaled) {
    AutoScalerConfig config = make_config();
    config.adjust_gradients_for_accumulation = false;
    AdaScale adascale(optimizer, engine, config);

    run_window(3.0f, 1.0f);

    // Local norms are multiplied by 4, the total is left as is
    EXPECT_EQ(adascale.last_total_grad_sqr(), (std::vector<double>{16.0}));
    EXPECT_NEAR(adascale.last_estimate().grad_var[0], 8.0, 1e-12);
    EXPECT_NEAR(adascale.last_estimate().grad_sqr[0], 12.0, 1e-12);
    EXPECT_NEAR(adascale.gain(), 5.0 / 4.0, 1e-12);
}

TEST_F(AdaScaleTest, OperationsAreRejectedMidWindow) {
    AdaScale adascale(optimizer, engine, make_config());
    engine.backward({{&weights, Matrix(1, 1, 3.0f)}});
    ASSERT_TRUE(adascale.is_window_open());

    EXPECT_THROW(adascale.step(), std::logic_error);
    EXPECT_THROW(adascale.zero_grad(), std::logic_error);
    EXPECT_THROW(adascale.get_step_increment(), std::logic_error);
    EXPECT_THROW(adascale.state_dict(), std::logic_error);
    EXPECT_THROW(adascale.load_state_dict(OptimizerStateDict()), std::logic_error);
    Parameter extra("extra", 1, 1);
    EXPECT_THROW(adascale.add_param_group(ParamGroup{{&extra}, Hyperparameters()}),
                 std::logic_error);

    engine.backward({{&weights, Matrix(1, 1, 1.0f)}});
    EXPECT_NO_THROW(adascale.step());
}

TEST_F(AdaScaleTest, FailingStepRestoresLearningRate) {
    Parameter param("param", 1, 1);
    FailingOptimizer failing(0.1f, 0.0f);
    failing.add_param_group(std::vector<Parameter*>{&param});
    BackwardEngine eng;
    AdaScale adascale(failing, eng, make_config());
    run_window(eng, param, 3.0f, 1.0f);

    EXPECT_THROW(adascale.step(), std::runtime_error);
    EXPECT_FLOAT_EQ(failing.hyperparameters(0).learning_rate, 0.1f);
}

TEST_F(AdaScaleTest, StepIncrementFollowsGain) {
    AdaScale adascale(optimizer, engine, make_config());

    iterate(adascale);
    EXPECT_NEAR(adascale.scale_invariant_steps(), 1.25, 1e-12);
    iterate(adascale);
    iterate(adascale);
    EXPECT_NEAR(adascale.scale_invariant_steps(), 3.75, 1e-12);
    EXPECT_EQ(adascale.real_iterations(), 3u);

    run_window(3.0f, 1.0f);
    EXPECT_EQ(adascale.get_step_increment(), 2);
}

TEST_F(AdaScaleTest, InvalidUpdatesDoNotCountTowardsWarmup) {
    AdaScale adascale(optimizer, engine, make_config());
    iterate(adascale);
    ASSERT_EQ(adascale.real_iterations(), 1u);

    for (int i = 0; i < 3; ++i) {
        run_window(2.0f, 2.0f);
        ASSERT_TRUE(adascale.gain_invalid());
        adascale.step();
        EXPECT_EQ(adascale.get_step_increment(), 1);
        adascale.zero_grad();
    }

    EXPECT_NEAR(adascale.scale_invariant_steps(), 1.25, 1e-12);
    EXPECT_EQ(adascale.real_iterations(), 1u);
}

TEST_F(AdaScaleTest, LossScaleIsRemovedFromStatistics) {
    DynamicLossScaler scaler(4.0f);
    AdaScale adascale(optimizer, engine, make_config(), nullptr, &scaler);

    run_window(12.0f, 4.0f);

    EXPECT_NEAR(adascale.last_estimate().grad_var[0], 2.0, 1e-12);
    EXPECT_NEAR(adascale.last_estimate().grad_sqr[0], 3.0, 1e-12);
    EXPECT_TRUE(adascale.step());
    EXPECT_NEAR(weights.value(0, 0), -0.5f, 1e-6);
}

TEST_F(AdaScaleTest, ClipsBeforeStepping) {
    AutoScalerConfig config = make_config();
    config.adascale.max_grad_norm = 1.0f;
    AdaScale adascale(optimizer, engine, config);

    run_window(3.0f, 1.0f);
    adascale.step();

    EXPECT_NEAR(adascale.clip_norm(), 4.0f, 1e-6);
    EXPECT_NEAR(weights.value(0, 0), -0.125f, 1e-5);
}

TEST_F(AdaScaleTest, PreconditionedNormsAfterWarmup) {
    Parameter param("param", 1, 1);
    Adam adam(0.01f);
    adam.add_param_group(std::vector<Parameter*>{&param});
    BackwardEngine eng;
    AutoScalerConfig config = make_config();
    config.precondition_gradients = true;
    AdaScale adascale(adam, eng, config);

    for (size_t i = 0; i < VarianceEstimator::MIN_STEPS; ++i) {
        run_window(eng, param, 3.0f, 1.0f);
        adascale.step();
        adascale.get_step_increment();
        adascale.zero_grad();
    }
    // Raw squared norm until now
    EXPECT_NEAR(adascale.last_total_grad_sqr()[0], 4.0, 1e-12);

    const Matrix pinv = adam.preconditioner(0, &param);
    ASSERT_FALSE(pinv.empty());
    const double p = pinv(0, 0);
    run_window(eng, param, 3.0f, 1.0f);

    EXPECT_NEAR(adascale.last_total_grad_sqr()[0], (4.0 / p) * (4.0 / p) / 4.0, 1e-6);
}

TEST_F(AdaScaleTest, FinalizeRunsAfterCallbacksQueuedDuringPass) {
    Parameter param("param", 1, 4);
    SGD sgd(0.1f, 0.0f);
    sgd.add_param_group(std::vector<Parameter*>{&param});
    BackwardEngine eng;
    AutoScalerConfig config = make_config();
    config.world_size = 2;
    config.num_gradients_to_accumulate = 1;
    AdaScale adascale(sgd, eng, config);

    // Registered after the controller, like a data-parallel wrapper
    eng.register_hook(&param, [&](const Matrix&) {
        eng.queue_callback([&]() { param.grad *= 2.0f; });
    });
    eng.backward({{&param, Matrix(1, 4, 1.0f)}});

    // The doubled gradient is what the total squared norm sees
    EXPECT_EQ(adascale.last_total_grad_sqr(), (std::vector<double>{16.0}));
    EXPECT_FALSE(adascale.is_window_open());
}

TEST_F(AdaScaleTest, OutlierSkipsAverageUpdate) {
    AdaScale adascale(optimizer, engine, make_config());
    for (size_t i = 0; i < VarianceEstimator::MIN_STEPS + 2; ++i) {
        iterate(adascale);
    }
    ASSERT_FALSE(adascale.gain_invalid());

    // Local squared norm jumps from 10 to 1000
    run_window(30.0f, 10.0f);

    EXPECT_TRUE(adascale.gain_invalid());
    EXPECT_EQ(adascale.gain(), 1.0);
    EXPECT_NEAR(adascale.grad_var_avg(), 2.0, 1e-12);
    EXPECT_NEAR(adascale.grad_sqr_avg(), 3.0, 1e-12);
    adascale.step();
    adascale.get_step_increment();
    adascale.zero_grad();

    // The same level again is accepted
    run_window(30.0f, 10.0f);
    EXPECT_FALSE(adascale.gain_invalid());
    EXPECT_NEAR(adascale.grad_var_avg(), 200.0, 1e-9);
    EXPECT_NEAR(adascale.grad_sqr_avg(), 300.0, 1e-9);
}

TEST_F(AdaScaleTest, GnsReportsScaleOneBatchSizeDuringWarmup) {
    AdaScale adascale(optimizer, engine, make_config());
    iterate(adascale);
    EXPECT_EQ(adascale.gns(), 32.0);
    EXPECT_EQ(adascale.averaged_gns(), 0.0);
}

TEST_F(AdaScaleTest, GnsPredictionAfterWarmup) {
    AutoScalerConfig config = make_config();
    config.is_adaptive = true;
    config.adjust_momentum = true;
    SGD sgd(0.1f, 0.9f);
    Parameter param("param", 1, 1);
    sgd.add_param_group(std::vector<Parameter*>{&param});
    BackwardEngine eng;
    AdaScale adascale(sgd, eng, config);

    for (size_t i = 0; i < VarianceEstimator::MIN_STEPS; ++i) {
        run_window(eng, param, 3.0f, 1.0f);
        adascale.step();
        adascale.get_step_increment();
        adascale.gns();
        adascale.zero_grad();
    }
    run_window(eng, param, 3.0f, 1.0f);
    const double gns = adascale.gns();

    // The raw prediction 32 * 2 / 3 is below the warm-up average of 32
    EXPECT_LT(gns, 32.0);
    EXPECT_GT(gns, 21.0);
    EXPECT_EQ(adascale.averaged_gns(), gns);
    // A predicted scale of 0 leaves the momentum alone
    EXPECT_FLOAT_EQ(sgd.hyperparameters(0).momentum, 0.9f);
    EXPECT_FLOAT_EQ(adascale.adjusted_beta1(), 0.9f);
}

/// Two single-weight groups fed 7 and 1 per window: var 18, sqr 7 in each group
class MomentumAdjustmentTest : public AdaScaleTest {
  protected:
    void SetUp() override {
        sgd.add_param_group(std::vector<Parameter*>{&first});
        sgd.add_param_group(std::vector<Parameter*>{&second});
    }

    /// Runs `iterations` updates and queries the GNS after each of them
    double train(AdaScale& adascale, size_t iterations) {
        double gns = 0.0;
        for (size_t i = 0; i < iterations; ++i) {
            eng.backward({{&first, Matrix(1, 1, 7.0f)}, {&second, Matrix(1, 1, 7.0f)}});
            eng.backward({{&first, Matrix(1, 1, 1.0f)}, {&second, Matrix(1, 1, 1.0f)}});
            adascale.step();
            adascale.get_step_increment();
            gns = adascale.gns();
            adascale.zero_grad();
        }
        return gns;
    }

    Parameter first{"first", 1, 1};
    Parameter second{"second", 1, 1};
    SGD sgd{0.01f, 0.9f};
    BackwardEngine eng;
};

TEST_F(MomentumAdjustmentTest, PredictedScaleRewritesEveryGroup) {
    AutoScalerConfig config = make_config();
    config.is_adaptive = true;
    config.adjust_momentum = true;
    AdaScale adascale(sgd, eng, config);

    train(adascale, VarianceEstimator::MIN_STEPS);
    EXPECT_FLOAT_EQ(sgd.hyperparameters(0).momentum, 0.9f);

    // Raw prediction 32 * 36 / 14, the average settles between 64 and 96
    const double gns = train(adascale, 80);
    ASSERT_FALSE(adascale.gain_invalid());
    EXPECT_GT(gns, 64.0);
    EXPECT_LE(gns, 32.0 * 36.0 / 14.0);

    // Predicted scale ceil(gns / 32) - 1 = 2
    const float expected = 1.0f - (1.0f - 0.9f) / 2.0f;
    EXPECT_FLOAT_EQ(adascale.adjusted_beta1(), expected);
    EXPECT_FLOAT_EQ(sgd.hyperparameters(0).momentum, expected);
    EXPECT_FLOAT_EQ(sgd.hyperparameters(1).momentum, expected);
    EXPECT_FLOAT_EQ(sgd.hyperparameters(0).learning_rate, 0.01f);
}

TEST_F(MomentumAdjustmentTest, MomentumIsLeftAloneOutsideAdaptiveMode) {
    AutoScalerConfig config = make_config();
    config.is_adaptive = false;
    config.adjust_momentum = true;
    AdaScale adascale(sgd, eng, config);

    const double gns = train(adascale, VarianceEstimator::MIN_STEPS + 80);
    EXPECT_GT(gns, 64.0);

    EXPECT_FLOAT_EQ(adascale.adjusted_beta1(), 0.9f);
    EXPECT_FLOAT_EQ(sgd.hyperparameters(0).momentum, 0.9f);
    EXPECT_FLOAT_EQ(sgd.hyperparameters(1).momentum, 0.9f);
}

TEST_F(AdaScaleTest, StateDictRoundTripIsIdempotent) {
    AdaScale adascale(optimizer, engine, make_config());
    iterate(adascale);
    iterate(adascale, 5.0f, 1.0f);
    OptimizerStateDict saved = adascale.state_dict();
    ASSERT_EQ(saved.namespaces.count(AdaScale::STATE_NAMESPACE), 1u);

    Parameter param("weights", 1, 1);
    SGD sgd(0.3f, 0.0f);
    sgd.add_param_group(std::vector<Parameter*>{&param});
    BackwardEngine eng;
    AdaScale restored(sgd, eng, make_config());
    restored.load_state_dict(saved);

    EXPECT_DOUBLE_EQ(restored.scale_invariant_steps(), adascale.scale_invariant_steps());
    EXPECT_DOUBLE_EQ(restored.grad_var_avg(), adascale.grad_var_avg());
    EXPECT_DOUBLE_EQ(restored.grad_sqr_avg(), adascale.grad_sqr_avg());
    EXPECT_FLOAT_EQ(sgd.hyperparameters(0).learning_rate, 0.1f);
    EXPECT_EQ(restored.state_dict().namespaces.at(AdaScale::STATE_NAMESPACE),
              saved.namespaces.at(AdaScale::STATE_NAMESPACE));
}

TEST_F(AdaScaleTest, ScaleChangeRescalesVariance) {
    RunState previous = RunState::initial(1, 4);
    previous.averages.update(RunState::GRAD_VAR_AVG, {3.0}, 0.0);
    previous.averages.update(RunState::GRAD_SQR_AVG, {5.0}, 0.0);
    previous.scale_invariant_steps = 7.5;
    OptimizerStateDict dict = optimizer.state_dict();
    dict.namespaces[AdaScale::STATE_NAMESPACE] = previous.to_blob();

    AdaScale adascale(optimizer, engine, make_config());
    adascale.load_state_dict(dict);

    EXPECT_NEAR(adascale.grad_var_avg(), 6.0, 1e-12);
    EXPECT_NEAR(adascale.grad_sqr_avg(), 5.0, 1e-12);
    EXPECT_DOUBLE_EQ(adascale.scale_invariant_steps(), 7.5);
    EXPECT_EQ(adascale.run_state().scale, 2u);
}

TEST_F(AdaScaleTest, ResetOnRestartDiscardsStatisticsAfterScaleChange) {
    RunState previous = RunState::initial(1, 4);
    previous.averages.update(RunState::GRAD_VAR_AVG, {3.0}, 0.0);
    previous.averages.update(RunState::GRAD_SQR_AVG, {5.0}, 0.0);
    previous.scale_invariant_steps = 7.5;
    OptimizerStateDict dict = optimizer.state_dict();
    dict.groups[0].learning_rate = 0.5f;
    dict.namespaces[AdaScale::STATE_NAMESPACE] = previous.to_blob();

    AutoScalerConfig config = make_config();
    config.reset_optimizer_state_on_restart = true;
    AdaScale adascale(optimizer, engine, config);
    adascale.load_state_dict(dict);

    EXPECT_EQ(adascale.grad_var_avg(), 0.0);
    EXPECT_EQ(adascale.grad_sqr_avg(), 1.0);
    EXPECT_DOUBLE_EQ(adascale.scale_invariant_steps(), 7.5);
    // The optimizer state is not loaded
    EXPECT_FLOAT_EQ(optimizer.hyperparameters(0).learning_rate, 0.1f);
}

TEST_F(AdaScaleTest, ResetOnRestartKeepsStatisticsAtSameScale) {
    RunState previous = RunState::initial(1, 2);
    previous.averages.update(RunState::GRAD_VAR_AVG, {3.0}, 0.0);
    OptimizerStateDict dict = optimizer.state_dict();
    dict.groups[0].learning_rate = 0.5f;
    dict.namespaces[AdaScale::STATE_NAMESPACE] = previous.to_blob();

    AutoScalerConfig config = make_config();
    config.reset_optimizer_state_on_restart = true;
    AdaScale adascale(optimizer, engine, config);
    adascale.load_state_dict(dict);

    EXPECT_NEAR(adascale.grad_var_avg(), 3.0, 1e-12);
    EXPECT_FLOAT_EQ(optimizer.hyperparameters(0).learning_rate, 0.5f);
}

TEST_F(AdaScaleTest, IncompatibleStateIsRejected) {
    AdaScale adascale(optimizer, engine, make_config());

    EXPECT_THROW(adascale.load_state_dict(optimizer.state_dict()), std::invalid_argument);

    OptimizerStateDict dict = optimizer.state_dict();
    dict.namespaces[AdaScale::STATE_NAMESPACE] = RunState::initial(3, 2).to_blob();
    EXPECT_THROW(adascale.load_state_dict(dict), std::invalid_argument);
}

TEST_F(AdaScaleTest, AddedGroupStartsWithNeutralStatistics) {
    AdaScale adascale(optimizer, engine, make_config());
    iterate(adascale);

    Parameter bias("bias", 1, 1);
    adascale.add_param_group(ParamGroup{{&bias}, optimizer.hyperparameters(0)});

    EXPECT_EQ(optimizer.num_param_groups(), 2u);
    EXPECT_EQ(adascale.num_hooks(), 2u);
    EXPECT_NEAR(adascale.grad_var_avg(0), 2.0, 1e-12);
    EXPECT_EQ(adascale.grad_var_avg(1), 0.0);
    EXPECT_EQ(adascale.grad_sqr_avg(1), 1.0);

    // Both groups are tracked from now on
    engine.backward({{&weights, Matrix(1, 1, 3.0f)}, {&bias, Matrix(1, 1, 3.0f)}});
    engine.backward({{&weights, Matrix(1, 1, 1.0f)}, {&bias, Matrix(1, 1, 1.0f)}});
    EXPECT_EQ(adascale.last_total_grad_sqr(), (std::vector<double>{4.0, 4.0}));
}

TEST_F(AdaScaleTest, HooksCanBeRemovedAndRestored) {
    AdaScale adascale(optimizer, engine, make_config());
    EXPECT_THROW(adascale.hook(), std::logic_error);

    adascale.unhook();
    EXPECT_EQ(engine.num_hooks(), 0u);
    run_window(3.0f, 1.0f);
    EXPECT_TRUE(adascale.gain_invalid());

    adascale.zero_grad();
    adascale.hook();
    run_window(3.0f, 1.0f);
    EXPECT_FALSE(adascale.gain_invalid());
}

TEST_F(AdaScaleTest, TemperatureFollowsLearningRateToBatchSizeRatio) {
    AdaScale adascale(optimizer, engine, make_config());
    EXPECT_EQ(adascale.current_batch_size(), 64u);

    iterate(adascale);
    EXPECT_DOUBLE_EQ(adascale.temperature(), 1.0);

    // Same learning rate over twice the batch
    adascale.set_current_batch_size(128);
    iterate(adascale);
    EXPECT_DOUBLE_EQ(adascale.temperature(), 0.5);
}

TEST_F(AdaScaleTest, SetScaleIsNotSupported) {
    AdaScale adascale(optimizer, engine, make_config());
    EXPECT_THROW(adascale.set_scale(4.0), std::logic_error);
}

TEST_F(AdaScaleTest, LogSummaryWritesSeriesAtScaleInvariantStep) {
    RecordingWriter writer;
    AdaScale adascale(optimizer, engine, make_config(), nullptr, nullptr, &writer);
    iterate(adascale);

    adascale.log_summary(0, 2);

    EXPECT_EQ(writer.count, 13u);
    ASSERT_EQ(writer.records.count("Train2/gain"), 1u);
    EXPECT_NEAR(writer.records["Train2/gain"].value, 1.25, 1e-12);
    EXPECT_NEAR(writer.records["Train2/gain"].step, 1.25, 1e-12);
    EXPECT_EQ(writer.records["Train2/Real Iterations"].value, 1.0);
    EXPECT_NEAR(writer.records["Train2/var_curr"].value, 2.0, 1e-12);
    EXPECT_NEAR(writer.records["Train2/sqr_curr"].value, 3.0, 1e-12);
    EXPECT_EQ(writer.records["Train2/scale"].value, 2.0);
    EXPECT_EQ(writer.records["Train2/accum_steps"].value, 2.0);
    EXPECT_NEAR(writer.records["Train2/Effective LR"].value, 0.125, 1e-7);
    EXPECT_EQ(writer.records.count("Train2/GNS"), 0u);
}

TEST_F(AdaScaleTest, LogSummaryAddsDebugSeries) {
    RecordingWriter writer;
    AutoScalerConfig config = make_config();
    config.enable_debug = true;
    AdaScale adascale(optimizer, engine, config, nullptr, nullptr, &writer);
    iterate(adascale);

    adascale.log_summary(7);
    Logger::getInstance().setDebug(false);

    EXPECT_EQ(writer.count, 16u);
    ASSERT_EQ(writer.records.count("Train/GNS"), 1u);
    EXPECT_EQ(writer.records["Train/GNS"].step, 7.0);
}

TEST_F(AdaScaleTest, ClusterStateIsAppendedToHistory) {
    const auto dir = std::filesystem::temp_directory_path() / "autoscaler_gns_history_test";
    std::filesystem::remove_all(dir);
    const std::string path = (dir / "GNS" / "gns_history.txt").string();

    AdaScale adascale(optimizer, engine, make_config());
    adascale.record_cluster_state(path);
    adascale.record_cluster_state(path);

    std::ifstream file(path);
    std::string line;
    size_t lines = 0;
    while (std::getline(file, line)) {
        EXPECT_EQ(line.rfind("64,1,true,32,2,0,", 0), 0u) << line;
        lines++;
    }
    EXPECT_EQ(lines, 2u);
    std::filesystem::remove_all(dir);
}
