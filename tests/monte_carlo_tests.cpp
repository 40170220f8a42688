#include <gtest/gtest.h>
#include "gbm/monte_carlo.hpp"
#include "gbm/report.hpp"
#include "gbm/logging.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

using namespace gbm;

class MonteCarloDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        model.initialPrice = 100.0;
        model.expectedAnnualReturn = 0.05;
        model.annualVolatility = 0.2;
        model.horizonYears = 1;
        model.tradingDaysPerYear = 260;

        batch.trials = 500;
        batch.seed = 1234;
    }

    SimulationParameters model;
    MonteCarloDriver::Parameters batch;
};

TEST_F(MonteCarloDriverTest, LossProbabilityConverges) {
    batch.trials = 10000;
    batch.num_threads = 4;

    MonteCarloDriver driver(model);
    auto summary = driver.run(batch);

    const double expected = theoreticalLossProbability(model);
    EXPECT_NEAR(summary.probabilityOfLoss, expected, 0.02);
    EXPECT_NEAR(summary.meanFinalPrice, MetricsCalculator::expectedPrice(model), 1.0);
}

TEST_F(MonteCarloDriverTest, LossProbabilityIsMeanOfIndicators) {
    MonteCarloDriver driver(model);
    auto summary = driver.run(batch);

    ASSERT_EQ(summary.trialLossIndicators.size(), batch.trials);
    size_t losses = std::count(summary.trialLossIndicators.begin(),
                               summary.trialLossIndicators.end(), true);
    EXPECT_EQ(summary.lossCount, losses);
    EXPECT_DOUBLE_EQ(summary.probabilityOfLoss,
                     static_cast<double>(losses) / static_cast<double>(batch.trials));

    for (size_t i = 0; i < batch.trials; ++i) {
        EXPECT_EQ(static_cast<bool>(summary.trialLossIndicators[i]),
                  summary.trialFinalPrices[i] < model.initialPrice);
    }
}

TEST_F(MonteCarloDriverTest, TrialOrderIsPreserved) {
    batch.trials = 50;
    batch.num_threads = 3;

    MonteCarloDriver driver(model);
    auto summary = driver.run(batch);

    ASSERT_EQ(summary.trialFinalPrices.size(), batch.trials);
    for (size_t i = 0; i < batch.trials; ++i) {
        EXPECT_DOUBLE_EQ(summary.trialFinalPrices[i], driver.runTrial(i, batch).finalPrice);
    }
}

TEST_F(MonteCarloDriverTest, ThreadCountDoesNotChangeResults) {
    MonteCarloDriver driver(model);

    batch.num_threads = 1;
    auto serial = driver.run(batch);
    batch.num_threads = 4;
    auto parallel = driver.run(batch);

    EXPECT_EQ(serial.trialFinalPrices, parallel.trialFinalPrices);
    EXPECT_DOUBLE_EQ(serial.probabilityOfLoss, parallel.probabilityOfLoss);
    EXPECT_DOUBLE_EQ(serial.lowerPercentile, parallel.lowerPercentile);
    EXPECT_DOUBLE_EQ(serial.upperPercentile, parallel.upperPercentile);
}

TEST_F(MonteCarloDriverTest, SeedChangesResults) {
    MonteCarloDriver driver(model);
    auto first = driver.run(batch);
    batch.seed = 4321;
    auto second = driver.run(batch);
    EXPECT_NE(first.trialFinalPrices, second.trialFinalPrices);
}

TEST_F(MonteCarloDriverTest, PercentileInterval) {
    MonteCarloDriver driver(model);
    auto summary = driver.run(batch);

    EXPECT_DOUBLE_EQ(summary.lowerPercentileLevel, 2.5);
    EXPECT_DOUBLE_EQ(summary.upperPercentileLevel, 97.5);
    EXPECT_LE(summary.lowerPercentile, summary.medianFinalPrice);
    EXPECT_LE(summary.medianFinalPrice, summary.upperPercentile);

    std::vector<double> sorted = summary.trialFinalPrices;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_DOUBLE_EQ(summary.lowerPercentile,
                     StatisticalAnalysis<double>::percentile(sorted, 0.025));
    EXPECT_DOUBLE_EQ(summary.upperPercentile,
                     StatisticalAnalysis<double>::percentile(sorted, 0.975));

    batch.lower_percentile = 0.0;
    batch.upper_percentile = 100.0;
    auto extremes = driver.run(batch);
    EXPECT_DOUBLE_EQ(extremes.lowerPercentile, sorted.front());
    EXPECT_DOUBLE_EQ(extremes.upperPercentile, sorted.back());
}

TEST_F(MonteCarloDriverTest, AggregatesMatchTrials) {
    batch.trials = 40;
    MonteCarloDriver driver(model);
    auto summary = driver.run(batch);

    double cagr_sum = 0;
    double worst = 0;
    for (size_t i = 0; i < batch.trials; ++i) {
        MetricsRecord record = driver.runTrial(i, batch);
        cagr_sum += record.cagr;
        worst = std::min(worst, record.maxDrawdown);
    }
    EXPECT_NEAR(summary.meanCagr, cagr_sum / 40.0, 1e-12);
    EXPECT_DOUBLE_EQ(summary.worstMaxDrawdown, worst);
    EXPECT_LE(summary.worstMaxDrawdown, summary.meanMaxDrawdown);
    EXPECT_EQ(summary.trials, batch.trials);
    EXPECT_EQ(summary.seed, batch.seed);
    EXPECT_EQ(summary.degenerateTrials, 0u);
}

TEST_F(MonteCarloDriverTest, DegenerateTrialsDoNotAbortBatch) {
    const double sigma = 0.2;
    model.annualVolatility = sigma;
    model.expectedAnnualReturn = 0.5 * sigma * sigma;
    batch.trials = 20;

    MonteCarloDriver driver(model);
    MonteCarloSummary summary;
    ASSERT_NO_THROW(summary = driver.run(batch));
    EXPECT_EQ(summary.trialFinalPrices.size(), 20u);
    EXPECT_EQ(summary.degenerateTrials, 20u);
    EXPECT_FALSE(driver.runTrial(0, batch).volatilityToDriftRatio.has_value());
}

TEST_F(MonteCarloDriverTest, ZeroVolatilityBatchIsDeterministic) {
    model.annualVolatility = 0.0;
    batch.trials = 10;
    batch.generator = RandomGeneratorType::XOR_SHIFT;

    MonteCarloDriver driver(model);
    auto summary = driver.run(batch);

    const double expected = 100.0 * std::exp(0.05);
    for (double price : summary.trialFinalPrices) {
        EXPECT_NEAR(price, expected, 1e-9);
    }
    EXPECT_DOUBLE_EQ(summary.probabilityOfLoss, 0.0);
    EXPECT_NEAR(summary.finalPriceStdDev, 0.0, 1e-9);
}

TEST_F(MonteCarloDriverTest, InvalidBatchFailsFast) {
    MonteCarloDriver driver(model);

    MonteCarloDriver::Parameters bad = batch;
    bad.trials = 0;
    EXPECT_THROW(driver.run(bad), InvalidParameter);

    bad = batch;
    bad.num_threads = 0;
    EXPECT_THROW(driver.run(bad), InvalidParameter);

    bad = batch;
    bad.lower_percentile = 90.0;
    bad.upper_percentile = 10.0;
    EXPECT_THROW(driver.run(bad), InvalidParameter);

    bad = batch;
    bad.upper_percentile = 101.0;
    EXPECT_THROW(driver.run(bad), InvalidParameter);
}

TEST_F(MonteCarloDriverTest, InvalidModelFailsBeforeAnyTrial) {
    SimulationParameters bad = model;
    bad.initialPrice = 0.0;
    EXPECT_THROW(MonteCarloDriver{bad}, InvalidParameter);

    bad = model;
    bad.horizonYears = -1;
    EXPECT_THROW(MonteCarloDriver{bad}, InvalidParameter);

    bad = model;
    bad.annualVolatility = -0.1;
    EXPECT_THROW(MonteCarloDriver{bad}, InvalidParameter);

    bad = model;
    bad.tradingDaysPerYear = 0;
    EXPECT_THROW(MonteCarloDriver{bad}, InvalidParameter);

    // Drifts that would overflow or underflow the price.
    bad = model;
    bad.expectedAnnualReturn = 800.0;
    EXPECT_THROW(MonteCarloDriver{bad}, InvalidParameter);

    bad = model;
    bad.expectedAnnualReturn = -800.0;
    EXPECT_THROW(MonteCarloDriver{bad}, InvalidParameter);
}

TEST_F(MonteCarloDriverTest, DefaultBatchParameters) {
    model.annualVolatility = 0.0;
    MonteCarloDriver driver(model);
    auto summary = driver.run();

    EXPECT_EQ(summary.trials, MonteCarloDriver::Parameters{}.trials);
    EXPECT_EQ(summary.seed, MonteCarloDriver::Parameters{}.seed);
    EXPECT_DOUBLE_EQ(summary.lowerPercentileLevel, 2.5);
    EXPECT_DOUBLE_EQ(summary.upperPercentileLevel, 97.5);
}

// Report formatting
TEST(ReportTest, NumberFormatting) {
    EXPECT_EQ(formatGrouped(1234567.891, 2), "1,234,567.89");
    EXPECT_EQ(formatGrouped(999.0, 1), "999.0");
    EXPECT_EQ(formatGrouped(-4061.26, 1), "-4,061.3");
    EXPECT_EQ(formatCurrency(10000.0), "$10,000.00");
    EXPECT_EQ(formatCurrency(-12.0), "-$12.00");
    EXPECT_EQ(formatPercent(0.0537), "5.37%");
    EXPECT_EQ(formatPercent(-0.25, 1), "-25.0%");
}

TEST(ReportTest, NegativeValuesRoundingToZeroHaveNoSign) {
    EXPECT_EQ(formatGrouped(-0.001, 2), "0.00");
    EXPECT_EQ(formatGrouped(-0.4, 0), "0");
    EXPECT_EQ(formatGrouped(-0.006, 2), "-0.01");
    EXPECT_EQ(formatCurrency(-0.001), "$0.00");
    EXPECT_EQ(formatCurrency(-0.006), "-$0.01");
}

TEST(ReportTest, OddsAndUndefinedValues) {
    EXPECT_EQ(formatOdds(0.00025), "1 in 4,000.0 trials");
    EXPECT_EQ(formatOdds(0.0), "undefined");
    EXPECT_EQ(formatOptional(std::nullopt), "undefined");
    EXPECT_EQ(formatOptional(1.23456, 2), "1.23");
}

TEST(ReportTest, MetricsReportMarksDegenerateMetrics) {
    SimulationParameters params;
    params.initialPrice = 100.0;
    params.annualVolatility = 0.2;
    params.expectedAnnualReturn = 0.5 * 0.2 * 0.2;

    MetricsRecord record = MetricsCalculator::compute(params, Trajectory{100.0});
    std::string report = formatMetricsReport(params, record);

    EXPECT_NE(report.find("Final Price:"), std::string::npos);
    EXPECT_NE(report.find("Max Drawdown:"), std::string::npos);
    EXPECT_NE(report.find("undefined"), std::string::npos);
}

TEST(ReportTest, MonteCarloReportShowsPercentiles) {
    SimulationParameters params;
    params.initialPrice = 100.0;
    params.expectedAnnualReturn = 0.05;
    params.annualVolatility = 0.2;

    MonteCarloDriver::Parameters batch;
    batch.trials = 100;
    auto summary = MonteCarloDriver(params).run(batch);

    std::string report = formatMonteCarloReport(params, summary, theoreticalLossProbability(params));
    EXPECT_NE(report.find("2.5th Percentile:"), std::string::npos);
    EXPECT_NE(report.find("97.5th Percentile:"), std::string::npos);
    EXPECT_NE(report.find("Closed-Form Loss:"), std::string::npos);
    EXPECT_NE(report.find(formatPercent(summary.probabilityOfLoss)), std::string::npos);
}

TEST(LoggingTest, UnknownLevelRejected) {
    EXPECT_THROW(setLogLevel("verbose"), InvalidParameter);
    EXPECT_THROW(setLogLevel(""), InvalidParameter);
    EXPECT_NO_THROW(setLogLevel("off"));
    EXPECT_NO_THROW(setLogLevel("warn"));
    EXPECT_NO_THROW(setLogLevel("info"));
}
