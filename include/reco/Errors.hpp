#pragma once

#include <stdexcept>
#include <string>

namespace reco {

// Embedding matrix or index missing/unreadable. Fatal for recommendation and
// similarity calls; never retried inside the engine.
class DataUnavailable : public std::runtime_error {
public:
    explicit DataUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// Index maps to an out-of-range or duplicate row. Raised at load time only.
class InconsistentData : public std::runtime_error {
public:
    explicit InconsistentData(const std::string& what) : std::runtime_error(what) {}
};

// A referenced movie has no embedding row. Callers treat this as
// "feature unavailable for this item".
class NotEmbedded : public std::runtime_error {
public:
    explicit NotEmbedded(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace reco
