#pragma once

#include <memory>
#include <vector>

#include "reco/EmbeddingStore.hpp"
#include "reco/History.hpp"
#include "reco/Models.hpp"
#include "reco/Sources.hpp"

namespace reco {

enum class SignalKind {
    Interest,
    Discovery,
    Collaborative,
    Category
};

const char* signal_name(SignalKind k);

struct SignalConfig {
    double half_life_days = 14.0;
    double neutral_rating = 5.0;     // used when a watched movie was never rated
    double rating_scale = 10.0;
    double dislike_threshold = 5.0;  // ratings strictly below count as disliked
    double normalize_epsilon = 1e-8;
};

// One scoring strategy over the whole catalog. Every result has one entry per
// matrix row; a signal with nothing to say returns all zeros.
class SignalComputer {
public:
    virtual ~SignalComputer() = default;
    virtual SignalKind kind() const = 0;
    virtual ScoreVector compute(const UserHistory& history) const = 0;
};

// Time-decayed, rating-weighted centroid of watched movies, dotted against every row.
class InterestSignal final : public SignalComputer {
public:
    InterestSignal(const EmbeddingData& data, const SignalConfig& cfg) : m_data(data), m_cfg(cfg) {}
    SignalKind kind() const override { return SignalKind::Interest; }
    ScoreVector compute(const UserHistory& history) const override;

private:
    const EmbeddingData& m_data;
    SignalConfig m_cfg;
};

// Negated similarity to the disliked centroid (skipped + low-rated), min-max scaled to [0,1].
class DiscoverySignal final : public SignalComputer {
public:
    DiscoverySignal(const EmbeddingData& data, const SignalConfig& cfg) : m_data(data), m_cfg(cfg) {}
    SignalKind kind() const override { return SignalKind::Discovery; }
    ScoreVector compute(const UserHistory& history) const override;

private:
    const EmbeddingData& m_data;
    SignalConfig m_cfg;
};

// Mean dot similarity to each watched movie.
class CollaborativeSignal final : public SignalComputer {
public:
    explicit CollaborativeSignal(const EmbeddingData& data) : m_data(data) {}
    SignalKind kind() const override { return SignalKind::Collaborative; }
    ScoreVector compute(const UserHistory& history) const override;

private:
    const EmbeddingData& m_data;
};

// Genre frequency over watched movies, summed per row and scaled so the max is 1.
class CategorySignal final : public SignalComputer {
public:
    CategorySignal(const EmbeddingData& data, const CatalogMetadata& catalog)
        : m_data(data), m_catalog(catalog) {}
    SignalKind kind() const override { return SignalKind::Category; }
    ScoreVector compute(const UserHistory& history) const override;

private:
    const EmbeddingData& m_data;
    const CatalogMetadata& m_catalog;
};

std::vector<std::unique_ptr<SignalComputer>> make_default_signals(const EmbeddingData& data,
                                                                  const CatalogMetadata& catalog,
                                                                  const SignalConfig& cfg);

}  // namespace reco
