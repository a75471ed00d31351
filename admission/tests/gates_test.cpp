#include <gtest/gtest.h>
#include "gates.hpp"
#include <limits>

class GateStackTest : public ::testing::Test {
protected:
    GateStack gates;

    RawSignalVector signals(double trend, double momentum, double volatility) {
        RawSignalVector s;
        s.trend = trend;
        s.momentum = momentum;
        s.volatility = volatility;
        return s;
    }
};

TEST_F(GateStackTest, VolatilityGateThresholds) {
    EXPECT_DOUBLE_EQ(gates.volatility_gate(signals(0, 0, -0.1)), 0.25);
    EXPECT_DOUBLE_EQ(gates.volatility_gate(signals(0, 0, 0.0)), 1.0);
    EXPECT_DOUBLE_EQ(gates.volatility_gate(signals(0, 0, 0.4)), 1.0);
    EXPECT_DOUBLE_EQ(gates.volatility_gate(signals(0, 0, 0.7)), 1.0);
    EXPECT_DOUBLE_EQ(gates.volatility_gate(signals(0, 0, 0.71)), 0.5);
}

TEST_F(GateStackTest, RegimeGateDampsContradictions) {
    EXPECT_DOUBLE_EQ(gates.regime_gate(signals(-0.3, -0.2, 0), RegimeLabel::Bull), 0.5);
    EXPECT_DOUBLE_EQ(gates.regime_gate(signals(0.3, 0.2, 0), RegimeLabel::Bear), 0.5);

    // Only one of the two disagreeing is not a contradiction
    EXPECT_DOUBLE_EQ(gates.regime_gate(signals(-0.3, 0.2, 0), RegimeLabel::Bull), 1.0);
    EXPECT_DOUBLE_EQ(gates.regime_gate(signals(0.3, -0.2, 0), RegimeLabel::Bear), 1.0);
    EXPECT_DOUBLE_EQ(gates.regime_gate(signals(0.3, 0.2, 0), RegimeLabel::Bull), 1.0);
}

TEST_F(GateStackTest, RegimeGateNeverDampsRangeOrUnknown) {
    for (auto regime : {RegimeLabel::Range, RegimeLabel::Unknown}) {
        EXPECT_DOUBLE_EQ(gates.regime_gate(signals(-0.5, -0.5, 0), regime), 1.0);
        EXPECT_DOUBLE_EQ(gates.regime_gate(signals(0.5, 0.5, 0), regime), 1.0);
    }
}

TEST_F(GateStackTest, SectorMultiplier) {
    EXPECT_DOUBLE_EQ(gates.sector_multiplier(signals(0.4, 0, 0), 0.2), 1.2);
    EXPECT_DOUBLE_EQ(gates.sector_multiplier(signals(-0.4, 0, 0), -0.2), 1.2);
    EXPECT_DOUBLE_EQ(gates.sector_multiplier(signals(0.4, 0, 0), -0.2), 0.5);
    EXPECT_DOUBLE_EQ(gates.sector_multiplier(signals(0.0, 0, 0), 0.2), 1.0);
    EXPECT_DOUBLE_EQ(gates.sector_multiplier(signals(0.4, 0, 0), 0.0), 1.0);
    EXPECT_DOUBLE_EQ(gates.sector_multiplier(signals(0.4, 0, 0), std::numeric_limits<double>::quiet_NaN()), 1.0);
}

TEST_F(GateStackTest, CompositeCapsSectorBoostAtFullStrength) {
    EXPECT_DOUBLE_EQ(gates.composite(1.0, 1.0, 1.2), 1.0);
}

TEST_F(GateStackTest, CompositeNeverDropsBelowMinimum) {
    // 0.25 * 0.5 * 0.5 = 0.0625
    EXPECT_DOUBLE_EQ(gates.composite(0.25, 0.5, 0.5), GATE_MIN);
    EXPECT_DOUBLE_EQ(gates.composite(0.5, 0.5, 1.0), 0.25);
}

// Composite stays in [GATE_MIN, 1.0] across a sweep of inputs
TEST_F(GateStackTest, CompositeBoundedOverSweep) {
    const double values[] = {-2.0, -0.7, -0.1, 0.0, 0.1, 0.5, 0.7, 0.71, 1.0, 3.0};
    const RegimeLabel regimes[] = {RegimeLabel::Bull, RegimeLabel::Bear, RegimeLabel::Range, RegimeLabel::Unknown};

    for (double trend : values) {
        for (double momentum : values) {
            for (double vol : values) {
                for (double sector : values) {
                    for (auto regime : regimes) {
                        Candidate c;
                        c.symbol = "SWEEP";
                        c.signals = signals(trend, momentum, vol);
                        c.regime = regime;
                        c.sector_momentum = sector;
                        GateBreakdown g = gates.evaluate(c);
                        ASSERT_GE(g.composite, GATE_MIN);
                        ASSERT_LE(g.composite, 1.0);
                    }
                }
            }
        }
    }
}
