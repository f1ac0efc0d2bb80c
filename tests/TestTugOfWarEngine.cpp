#include "analytics/TugOfWarEngine.h"
#include "analytics/Verdict.h"

#include <cassert>
#include <cmath>
#include <cstdlib>
#include <iostream>

using namespace tugofwar;

namespace {

constexpr long long kTenAmIst = 1705293000000LL;   // 2024-01-15 10:00 IST

market::StrikeMetrics row(int strike,
                          long long ce_oi, long long ce_chg, double ce_ltp,
                          long long pe_oi, long long pe_chg, double pe_ltp) {
    market::StrikeMetrics m;
    m.strike = strike;
    m.call_oi = ce_oi;
    m.call_oi_change = ce_chg;
    m.call_ltp = ce_ltp;
    m.put_oi = pe_oi;
    m.put_oi_change = pe_chg;
    m.put_ltp = pe_ltp;
    return m;
}

market::Snapshot singleStrikeChain() {
    market::Snapshot s;
    s.timestamp_ms = kTenAmIst;
    s.spot_price = 24025.50;
    s.expiry = "2024-01-18";
    s.strikes[24000] = row(24000, 250000, 15000, 142.25, 220000, 20000, 118.50);
    return s;
}

market::Snapshot sampleChain() {
    market::Snapshot s;
    s.timestamp_ms = kTenAmIst;
    s.spot_price = 24020.0;
    s.expiry = "2024-01-18";
    s.strikes[23900] = row(23900, 80000, 2000, 210.0, 310000, 45000, 62.0);
    s.strikes[23950] = row(23950, 110000, 3000, 175.0, 260000, 38000, 80.0);
    s.strikes[24000] = row(24000, 250000, 15000, 142.25, 220000, 20000, 118.50);
    s.strikes[24050] = row(24050, 190000, 6000, 110.0, 120000, 9000, 150.0);
    s.strikes[24100] = row(24100, 280000, 4000, 85.0, 70000, 1500, 190.0);
    s.strikes[24150] = row(24150, 240000, 2500, 62.0, 40000, 800, 232.0);
    s.strikes[24200] = row(24200, 330000, 1800, 45.0, 30000, 300, 280.0);
    for (auto& [strike, m] : s.strikes) {
        (void)strike;
        m.call_volume = std::llabs(m.call_oi_change);
        m.put_volume = std::llabs(m.put_oi_change);
    }
    return s;
}

} // namespace

int main() {
    analytics::TugOfWarEngine engine;
    const engine::MarketHistory no_history;

    // Single strike: put writing outpaces call writing
    {
        const auto a = engine.analyze(singleStrikeChain(), no_history);
        assert(a.valid);
        if (a.atm_strike != 24000) {
            std::cerr << "[TEST] ATM should be 24000, got " << a.atm_strike << "\n";
            return 1;
        }
        if (!(a.combined_score > 0.0) || a.direction() != Direction::BULLISH) {
            std::cerr << "[TEST] expected bullish bias, score=" << a.combined_score << "\n";
            return 1;
        }
        if (std::abs(a.combined_score - 35.0) > 1e-6 || a.verdict != analytics::Verdict::BULLS_WINNING) {
            std::cerr << "[TEST] expected Bulls Winning at 35, got " << analytics::toString(a.verdict)
                      << " " << a.combined_score << "\n";
            return 1;
        }
        assert(a.trade_setup.has_value());
        assert(a.trade_setup->option_side == OptionSide::CE);
        assert(a.trade_setup->strike == 24000);
        assert(a.trade_setup->moneyness == Moneyness::ATM);
        assert(a.confidence >= 0.0 && a.confidence <= 100.0);
    }

    // Empty chain
    {
        market::Snapshot empty;
        empty.timestamp_ms = kTenAmIst;
        empty.spot_price = 24000.0;
        const auto a = engine.analyze(empty, no_history);
        if (a.valid || a.verdict != analytics::Verdict::NEUTRAL || a.trade_setup) {
            std::cerr << "[TEST] empty chain should be invalid and neutral\n";
            return 1;
        }
        assert(!a.error.empty());
    }

    // All-zero OI stays finite
    {
        market::Snapshot zero;
        zero.timestamp_ms = kTenAmIst;
        zero.spot_price = 24010.0;
        for (int strike = 23900; strike <= 24100; strike += 50) {
            zero.strikes[strike] = row(strike, 0, 0, 0.0, 0, 0, 0.0);
            zero.strikes[strike].call_ltp.reset();
            zero.strikes[strike].put_ltp.reset();
        }
        const auto a = engine.analyze(zero, no_history);
        assert(a.valid);
        if (!std::isfinite(a.combined_score) || !std::isfinite(a.confidence)) {
            std::cerr << "[TEST] zero OI produced non-finite output\n";
            return 1;
        }
        assert(a.verdict == analytics::Verdict::NEUTRAL);
        assert(!a.trade_setup.has_value());
        assert(!a.pcr.has_value());
    }

    // Classifier boundaries are exclusive and stable
    {
        assert(analytics::classifyVerdict(0.0).verdict == analytics::Verdict::NEUTRAL);
        assert(analytics::classifyVerdict(15.0).verdict == analytics::Verdict::SLIGHTLY_BULLISH);
        assert(analytics::classifyVerdict(15.01).verdict == analytics::Verdict::BULLS_WINNING);
        assert(analytics::classifyVerdict(40.0).verdict == analytics::Verdict::BULLS_WINNING);
        assert(analytics::classifyVerdict(40.5).verdict == analytics::Verdict::BULLS_STRONGLY_WINNING);
        assert(analytics::classifyVerdict(-15.0).verdict == analytics::Verdict::SLIGHTLY_BEARISH);
        assert(analytics::classifyVerdict(-41.0).strength == analytics::SignalStrength::STRONG);
        for (double score : {-80.0, -20.0, -3.0, 0.0, 7.0, 22.0, 64.0}) {
            const auto first = analytics::classifyVerdict(score);
            const auto second = analytics::classifyVerdict(score);
            if (first.verdict != second.verdict || first.strength != second.strength) {
                std::cerr << "[TEST] classifier not deterministic at " << score << "\n";
                return 1;
            }
        }
        assert(analytics::verdictFromString("Bears Winning") == analytics::Verdict::BEARS_WINNING);
    }

    // Conviction buckets
    {
        analytics::ForceCalculator forces{engine::ScoringConfig()};
        assert(forces.convictionMultiplier(1000, 1000) == 1.5);
        assert(forces.convictionMultiplier(300, 1000) == 1.0);
        assert(forces.convictionMultiplier(100, 1000) == 0.5);
        assert(forces.convictionMultiplier(100000, 50) == 0.5);
    }

    // OI/price divergence hands momentum a bigger say
    {
        analytics::StrengthAggregator aggregator{engine::ScoringConfig()};
        analytics::LegacyZoneScores legacy;
        legacy.below_score = 100.0;
        analytics::StrengthRatios ratios;
        const auto blend = aggregator.combine(legacy, ratios, -40.0, -2.0);
        assert(blend.divergence);
        if (std::abs(blend.combined_score - 1.25) > 1e-9) {
            std::cerr << "[TEST] divergence blend expected 1.25, got " << blend.combined_score << "\n";
            return 1;
        }
        const auto flat = aggregator.combine(legacy, ratios, 0.0, 0.0);
        assert(std::abs(flat.combined_score - 35.0) < 1e-9);
        assert(flat.zone_weight == 1.0);
    }

    // Regime from a rising window
    {
        analytics::RegimeDetector detector{engine::ScoringConfig()};
        const auto up = detector.analyzeRegime({100.0, 100.5}, 101.0, 30.0);
        assert(up.regime == analytics::MarketRegime::TRENDING_UP);
        assert(up.oi_change_weight == 0.30 && up.total_oi_weight == 0.70);
        const auto flat = detector.analyzeRegime({100.0, 100.05}, 100.02, 2.0);
        assert(flat.regime == analytics::MarketRegime::RANGE_BOUND);
        assert(flat.oi_change_weight == 0.70);
        assert(analytics::RegimeDetector::fromString("trending_down") == analytics::MarketRegime::TRENDING_DOWN);
    }

    // Max pain over a three strike book
    {
        market::Snapshot s;
        s.spot_price = 108.0;
        s.strikes[100] = row(100, 10, 0, 1.0, 50, 0, 1.0);
        s.strikes[110] = row(110, 20, 0, 1.0, 20, 0, 1.0);
        s.strikes[120] = row(120, 50, 0, 1.0, 10, 0, 1.0);
        const auto mp = analytics::ChainStructure::maxPain(s);
        assert(mp.valid);
        if (mp.strike != 110 || std::abs(mp.total_payout - 200.0) > 1e-9) {
            std::cerr << "[TEST] max pain expected 110/200, got " << mp.strike << "/" << mp.total_payout << "\n";
            return 1;
        }
    }

    // Percentile and clusters on the sample chain
    {
        assert(std::abs(analytics::ChainStructure::percentile({1.0, 2.0, 3.0, 4.0}, 75.0) - 3.25) < 1e-9);

        const auto chain = sampleChain();
        analytics::ChainStructure structure{engine::ScoringConfig()};
        const auto clusters = structure.oiClusters(chain);
        assert(!clusters.resistance.empty());
        assert(!clusters.support.empty());
        assert(clusters.resistance.front().strike == 24200);
        assert(clusters.resistance.front().distance_pct > 0.0);
        assert(clusters.support.front().strike == 23900);
        assert(clusters.support.front().distance_pct < 0.0);
        for (std::size_t i = 1; i < clusters.resistance.size(); ++i) {
            assert(clusters.resistance[i - 1].oi >= clusters.resistance[i].oi);
        }
    }

    // Full sample chain with a rising history
    {
        const auto chain = sampleChain();
        engine::MarketHistory history;
        history.price_history = {23950.0, 23975.0, 24000.0, 24010.0};
        history.oi_change_history = {{30000, 100000}, {32000, 105000}};
        history.vix = 13.5;

        const auto a = engine.analyze(chain, history);
        assert(a.valid);
        assert(a.atm_strike == 24000);
        assert(a.zones.otm_put.strikes.size() == 2);
        assert(a.zones.otm_call.strikes.size() == 3);
        if (a.direction() != Direction::BULLISH) {
            std::cerr << "[TEST] sample chain should read bullish, got " << analytics::toString(a.verdict) << "\n";
            return 1;
        }
        assert(a.blend.price_direction == Direction::BULLISH);
        assert(a.confirmation == analytics::ConfirmationStatus::CONFIRMED);
        assert(a.pcr.has_value() && *a.pcr > 0.0);
        assert(a.max_pain.valid);
        assert(a.trade_setup.has_value());
        assert(a.trade_setup->strike == 23950);
        assert(a.trade_setup->moneyness == Moneyness::ITM);
        assert(a.combined_score <= 100.0 && a.combined_score >= -100.0);

        const auto again = engine.analyze(chain, history);
        assert(again.combined_score == a.combined_score);
        assert(again.verdict == a.verdict);

        const auto j = analytics::toJson(a);
        assert(j.contains("verdict"));
        assert(!analytics::formatSummary(a).empty());
    }

    std::cout << "[TEST] TugOfWarEngine PASSED\n";
    return 0;
}
