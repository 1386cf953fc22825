#include "reco/WeightScheme.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace reco {

const char* tier_name(WeightTier t) {
    switch (t) {
        case WeightTier::Sparse: return "sparse";
        case WeightTier::Moderate: return "moderate";
        case WeightTier::Rich: return "rich";
        default: return "unknown";
    }
}

SignalWeights::SignalWeights(double interest, double discovery, double collaborative, double category)
    : m_interest(interest), m_discovery(discovery), m_collaborative(collaborative), m_category(category) {
    if (interest < 0.0 || discovery < 0.0 || collaborative < 0.0 || category < 0.0) {
        throw std::invalid_argument("signal weights must be non-negative");
    }
    if (std::fabs(sum() - 1.0) > 1e-9) {
        throw std::invalid_argument("signal weights must sum to 1, got " + std::to_string(sum()));
    }
}

double SignalWeights::of(SignalKind k) const {
    switch (k) {
        case SignalKind::Interest: return m_interest;
        case SignalKind::Discovery: return m_discovery;
        case SignalKind::Collaborative: return m_collaborative;
        case SignalKind::Category: return m_category;
    }
    return 0.0;
}

WeightTier tier_for(std::size_t watched_count) {
    if (watched_count < 5) return WeightTier::Sparse;
    if (watched_count < 20) return WeightTier::Moderate;
    return WeightTier::Rich;
}

// Sparse history leans on collaborative/category priors; richer history
// shifts toward interest and discovery.
const SignalWeights& weights_for(WeightTier tier) {
    static const SignalWeights sparse(0.20, 0.10, 0.30, 0.40);
    static const SignalWeights moderate(0.35, 0.25, 0.25, 0.15);
    static const SignalWeights rich(0.40, 0.30, 0.20, 0.10);

    switch (tier) {
        case WeightTier::Sparse: return sparse;
        case WeightTier::Moderate: return moderate;
        case WeightTier::Rich: return rich;
    }
    return sparse;
}

TierWeights adaptive_weights(std::size_t watched_count) {
    const WeightTier t = tier_for(watched_count);
    return TierWeights{t, weights_for(t)};
}

}  // namespace reco
