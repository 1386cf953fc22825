#pragma once

#include <set>
#include <string>
#include <vector>

#include "reco/Models.hpp"

namespace reco {

// Read side of the interaction log. The engine never mutates what it gets back.
class InteractionReader {
public:
    virtual ~InteractionReader() = default;
    virtual std::vector<InteractionRecord> get(UserId user_id) const = 0;
};

class CatalogMetadata {
public:
    virtual ~CatalogMetadata() = default;

    virtual std::set<std::string> genres(MovieId movie_id) const = 0;

    // cold-start ordering key
    virtual double popularity(MovieId movie_id) const = 0;

    // every movie the catalog knows about, embedded or not
    virtual std::vector<MovieId> movie_ids() const = 0;

    virtual std::string title(MovieId) const { return {}; }
};

class NullInteractionReader final : public InteractionReader {
public:
    std::vector<InteractionRecord> get(UserId) const override { return {}; }
};

}  // namespace reco
