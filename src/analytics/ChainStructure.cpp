#include "analytics/ChainStructure.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace tugofwar {
namespace analytics {

namespace {

std::vector<OiCluster> topClusters(std::vector<OiCluster> candidates, int top_n) {
    std::sort(candidates.begin(), candidates.end(), [](const OiCluster& a, const OiCluster& b) {
        if (a.oi != b.oi) {
            return a.oi > b.oi;
        }
        return a.strike < b.strike;
    });
    if (top_n >= 0 && candidates.size() > static_cast<std::size_t>(top_n)) {
        candidates.resize(static_cast<std::size_t>(top_n));
    }
    return candidates;
}

double averageIv(const market::Snapshot& snapshot, const std::vector<int>& strikes, OptionSide side) {
    double sum = 0.0;
    int count = 0;
    for (int strike : strikes) {
        const auto* metrics = snapshot.find(strike);
        if (!metrics) {
            continue;
        }
        const double iv = metrics->ivOr0(side);
        if (iv > 0.0) {
            sum += iv;
            ++count;
        }
    }
    return count > 0 ? sum / count : 0.0;
}

} // namespace

ChainStructure::ChainStructure(const engine::ScoringConfig& config)
    : config_(config) {}

MaxPain ChainStructure::maxPain(const market::Snapshot& snapshot) {
    MaxPain result;
    if (snapshot.empty()) {
        return result;
    }

    double best = std::numeric_limits<double>::max();
    for (const auto& [settle, unused] : snapshot.strikes) {
        (void)unused;
        double payout = 0.0;
        for (const auto& [strike, metrics] : snapshot.strikes) {
            if (settle > strike) {
                payout += static_cast<double>(metrics.call_oi) * (settle - strike);
            } else if (settle < strike) {
                payout += static_cast<double>(metrics.put_oi) * (strike - settle);
            }
        }
        // strict less keeps the lowest strike on ties
        if (payout < best) {
            best = payout;
            result.strike = settle;
        }
    }

    result.valid = true;
    result.total_payout = best;
    if (snapshot.spot_price > 0.0) {
        result.distance_pct = std::abs(snapshot.spot_price - result.strike) / snapshot.spot_price * 100.0;
    }
    return result;
}

OiClusters ChainStructure::oiClusters(const market::Snapshot& snapshot) const {
    OiClusters clusters;
    if (snapshot.empty() || !(snapshot.spot_price > 0.0)) {
        return clusters;
    }

    std::vector<double> call_ois;
    std::vector<double> put_ois;
    for (const auto& [strike, metrics] : snapshot.strikes) {
        (void)strike;
        if (metrics.call_oi > 0) call_ois.push_back(static_cast<double>(metrics.call_oi));
        if (metrics.put_oi > 0) put_ois.push_back(static_cast<double>(metrics.put_oi));
    }

    const double call_cut = percentile(call_ois, config_.cluster_percentile);
    const double put_cut = percentile(put_ois, config_.cluster_percentile);
    const double spot = snapshot.spot_price;

    std::vector<OiCluster> resistance;
    std::vector<OiCluster> support;
    for (const auto& [strike, metrics] : snapshot.strikes) {
        const double distance = (strike - spot) / spot * 100.0;
        if (strike > spot && metrics.call_oi > 0 && metrics.call_oi >= call_cut) {
            resistance.push_back({strike, metrics.call_oi, distance});
        } else if (strike < spot && metrics.put_oi > 0 && metrics.put_oi >= put_cut) {
            support.push_back({strike, metrics.put_oi, distance});
        }
    }

    clusters.resistance = topClusters(std::move(resistance), config_.cluster_top_n);
    clusters.support = topClusters(std::move(support), config_.cluster_top_n);
    return clusters;
}

IvSkew ChainStructure::ivSkew(const market::Snapshot& snapshot, const ZoneLayout& layout) const {
    IvSkew skew;
    if (!layout.valid) {
        return skew;
    }

    skew.otm_put_iv = averageIv(snapshot, layout.below, OptionSide::PE);
    skew.otm_call_iv = averageIv(snapshot, layout.above, OptionSide::CE);
    if (skew.otm_put_iv <= 0.0 || skew.otm_call_iv <= 0.0) {
        return skew;
    }

    const double mean = (skew.otm_put_iv + skew.otm_call_iv) / 2.0;
    skew.skew_score = std::clamp((skew.otm_put_iv - skew.otm_call_iv) / mean * 100.0, -100.0, 100.0);
    skew.valid = true;
    if (skew.skew_score > config_.iv_skew_threshold) {
        skew.direction = Direction::BEARISH;
    } else if (skew.skew_score < -config_.iv_skew_threshold) {
        skew.direction = Direction::BULLISH;
    }
    return skew;
}

std::optional<double> ChainStructure::volumePcr(const market::Snapshot& snapshot) {
    long long calls = 0;
    long long puts = 0;
    for (const auto& [strike, metrics] : snapshot.strikes) {
        (void)strike;
        calls += metrics.call_volume;
        puts += metrics.put_volume;
    }
    if (calls <= 0) {
        return std::nullopt;
    }
    return static_cast<double>(puts) / static_cast<double>(calls);
}

std::optional<double> ChainStructure::oiPcr(const market::Snapshot& snapshot) {
    long long calls = 0;
    long long puts = 0;
    for (const auto& [strike, metrics] : snapshot.strikes) {
        (void)strike;
        calls += metrics.call_oi;
        puts += metrics.put_oi;
    }
    if (calls <= 0) {
        return std::nullopt;
    }
    return static_cast<double>(puts) / static_cast<double>(calls);
}

Direction ChainStructure::oiDirection(double zone_average) const {
    if (zone_average > config_.oi_direction_threshold) return Direction::BULLISH;
    if (zone_average < -config_.oi_direction_threshold) return Direction::BEARISH;
    return Direction::NEUTRAL;
}

Direction ChainStructure::priceDirection(double price_change_pct) const {
    if (price_change_pct > config_.price_move_threshold_pct) return Direction::BULLISH;
    if (price_change_pct < -config_.price_move_threshold_pct) return Direction::BEARISH;
    return Direction::NEUTRAL;
}

ConfirmationStatus ChainStructure::confirmationStatus(double zone_average, double price_change_pct) const {
    const Direction oi = oiDirection(zone_average);
    const Direction price = priceDirection(price_change_pct);
    if (oi == Direction::NEUTRAL || price == Direction::NEUTRAL) {
        return ConfirmationStatus::NEUTRAL;
    }
    if (oi == price) {
        return ConfirmationStatus::CONFIRMED;
    }
    // strong OI against price: writers leaning into the move
    if (std::abs(zone_average) >= config_.strong_oi_score) {
        return ConfirmationStatus::REVERSAL_ALERT;
    }
    return ConfirmationStatus::CONFLICT;
}

TrapWarning ChainStructure::detectTrap(const market::Snapshot& snapshot,
                                       const OiClusters& clusters,
                                       double zone_average,
                                       double price_change_pct) const {
    TrapWarning warning;
    const Direction price = priceDirection(price_change_pct);
    const double proximity = config_.trap_proximity_pct;

    if (price == Direction::BULLISH && zone_average <= -config_.strong_oi_score) {
        for (const auto& cluster : clusters.resistance) {
            if (cluster.distance_pct > 0.0 && cluster.distance_pct <= proximity) {
                warning.type = TrapType::BULL_TRAP;
                warning.cluster_strike = cluster.strike;
                break;
            }
        }
    } else if (price == Direction::BEARISH && zone_average >= config_.strong_oi_score) {
        for (const auto& cluster : clusters.support) {
            if (cluster.distance_pct < 0.0 && -cluster.distance_pct <= proximity) {
                warning.type = TrapType::BEAR_TRAP;
                warning.cluster_strike = cluster.strike;
                break;
            }
        }
    }

    if (warning.type != TrapType::NONE) {
        std::ostringstream oss;
        oss << (warning.type == TrapType::BULL_TRAP
                    ? "Price rising into call wall at "
                    : "Price falling onto put wall at ")
            << warning.cluster_strike << " (spot " << snapshot.spot_price << ")";
        warning.message = oss.str();
    }
    return warning;
}

double ChainStructure::percentile(std::vector<double> values, double pct) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    const double rank = std::clamp(pct, 0.0, 100.0) / 100.0 * static_cast<double>(values.size() - 1);
    const std::size_t lo = static_cast<std::size_t>(std::floor(rank));
    const std::size_t hi = static_cast<std::size_t>(std::ceil(rank));
    const double frac = rank - static_cast<double>(lo);
    return values[lo] + (values[hi] - values[lo]) * frac;
}

const char* ChainStructure::toString(ConfirmationStatus status) {
    switch (status) {
        case ConfirmationStatus::CONFIRMED: return "CONFIRMED";
        case ConfirmationStatus::REVERSAL_ALERT: return "REVERSAL_ALERT";
        case ConfirmationStatus::CONFLICT: return "CONFLICT";
        case ConfirmationStatus::NEUTRAL: return "NEUTRAL";
    }
    return "NEUTRAL";
}

const char* ChainStructure::toString(TrapType type) {
    switch (type) {
        case TrapType::NONE: return "NONE";
        case TrapType::BULL_TRAP: return "BULL_TRAP";
        case TrapType::BEAR_TRAP: return "BEAR_TRAP";
    }
    return "NONE";
}

} // namespace analytics
} // namespace tugofwar
