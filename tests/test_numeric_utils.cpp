#include <gtest/gtest.h>

#include <cmath>

#include <vector>

#include "internal/utils/numeric_utils.hpp"
#include "internal/vha_types.hpp"

using namespace vha;

TEST(NumericUtilsTest, Tau2ffStaysInUnitInterval) {
    for (double tau : {1.0, 5.0, 700.0, 10000.0, 1e7}) {
        for (double fs : {0.6667, 16.0, 1000.0}) {
            double ff = utils::tau2ff(tau, fs);
            EXPECT_GT(ff, 0.0) << "tau=" << tau << " fs=" << fs;
            EXPECT_LT(ff, 1.0) << "tau=" << tau << " fs=" << fs;
        }
    }
}

TEST(NumericUtilsTest, Tau2ffDecreasesWithTimeConstant) {
    const double fs = 1.0 / 1.5;
    double previous = utils::tau2ff(0.5, fs);
    for (double tau : {1.0, 5.0, 50.0, 700.0, 10000.0}) {
        double current = utils::tau2ff(tau, fs);
        EXPECT_LT(current, previous) << "tau=" << tau;
        previous = current;
    }
}

TEST(NumericUtilsTest, Tau2ffMatchesClosedForm) {
    // 1 - exp(-1 / ((5 / 2.3) * 0.5))
    EXPECT_NEAR(utils::tau2ff(5.0, 0.5), 1.0 - std::exp(-1.0 / (5.0 / 2.3 * 0.5)), 1e-12);
}

TEST(NumericUtilsTest, Tau2ffRejectsNonPositiveArguments) {
    EXPECT_THROW(utils::tau2ff(0.0, 1.0), ConfigError);
    EXPECT_THROW(utils::tau2ff(-5.0, 1.0), ConfigError);
    EXPECT_THROW(utils::tau2ff(5.0, 0.0), ConfigError);
}

TEST(NumericUtilsTest, CutoffFrequency) {
    // tau = 2.3 ms -> 1 / (2π · 1e-3) Hz
    EXPECT_NEAR(utils::calculateFc(2.3), 1000.0 / (2.0 * std::acos(-1.0)), 1e-9);
    EXPECT_THROW(utils::calculateFc(0.0), ConfigError);
}

TEST(NumericUtilsTest, LambdaMixing) {
    EXPECT_DOUBLE_EQ(utils::calculateLambda(0.2, 0.8, 1.0), 0.2);
    EXPECT_DOUBLE_EQ(utils::calculateLambda(0.2, 0.8, 0.0), 0.8);
    EXPECT_DOUBLE_EQ(utils::calculateLambda(0.2, 0.8, 0.5), 0.5);
}

TEST(NumericUtilsTest, ProcessAndObservationVariance) {
    EXPECT_DOUBLE_EQ(utils::lambdaToProcessVar(0.5), 0.5);
    EXPECT_DOUBLE_EQ(utils::lambdaToObservationVar(0.25), 4.0);
    EXPECT_THROW(utils::lambdaToProcessVar(1.0), ConfigError);
    EXPECT_THROW(utils::lambdaToProcessVar(0.0), ConfigError);
    EXPECT_THROW(utils::lambdaToObservationVar(0.0), ConfigError);
}

TEST(NumericUtilsTest, GammaHyperparameters) {
    auto shape_rate = utils::gammaHyperparametersShapeRate(4.0, 2.0);
    EXPECT_DOUBLE_EQ(shape_rate.first, 2.0);
    EXPECT_DOUBLE_EQ(shape_rate.second, 0.5);
    // shape / rate 等于期望精度
    EXPECT_DOUBLE_EQ(shape_rate.first / shape_rate.second, 4.0);
    EXPECT_THROW(utils::gammaHyperparametersShapeRate(0.0), ConfigError);
}

TEST(NumericUtilsTest, DecibelConversion) {
    auto lin = utils::db2lin({0.0, -6.0, -12.0, -18.0});
    std::vector<double> expected = {1.0, 0.50119, 0.25119, 0.12589};
    ASSERT_EQ(lin.size(), expected.size());
    for (size_t i = 0; i < lin.size(); ++i) {
        EXPECT_NEAR(lin[i], expected[i], 1e-5);
    }
    EXPECT_NEAR(utils::linearToDb(utils::dbToLinear(-7.5)), -7.5, 1e-12);
}

TEST(NumericUtilsTest, LogisticIsStableForLargeArguments) {
    EXPECT_DOUBLE_EQ(utils::logistic(0.0), 0.5);
    EXPECT_NEAR(utils::logistic(800.0), 1.0, 1e-15);
    EXPECT_GE(utils::logistic(-800.0), 0.0);
    EXPECT_TRUE(std::isfinite(utils::softplus(800.0)));
    EXPECT_NEAR(utils::softplus(0.0), std::log(2.0), 1e-15);
    EXPECT_NEAR(utils::logSumExp(1000.0, 1000.0), 1000.0 + std::log(2.0), 1e-9);
}
