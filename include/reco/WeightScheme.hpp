#pragma once

#include <cstddef>

#include "reco/Signals.hpp"

namespace reco {

enum class WeightTier {
    Sparse,    // n < 5
    Moderate,  // 5 <= n < 20
    Rich       // n >= 20
};

const char* tier_name(WeightTier t);

// Blend of the four signals. Construction rejects negative weights and
// blends that do not sum to 1.
class SignalWeights {
public:
    SignalWeights(double interest, double discovery, double collaborative, double category);

    double interest() const { return m_interest; }
    double discovery() const { return m_discovery; }
    double collaborative() const { return m_collaborative; }
    double category() const { return m_category; }

    double of(SignalKind k) const;
    double sum() const { return m_interest + m_discovery + m_collaborative + m_category; }

private:
    double m_interest;
    double m_discovery;
    double m_collaborative;
    double m_category;
};

struct TierWeights {
    WeightTier tier;
    SignalWeights weights;
};

WeightTier tier_for(std::size_t watched_count);
const SignalWeights& weights_for(WeightTier tier);

TierWeights adaptive_weights(std::size_t watched_count);

}  // namespace reco
