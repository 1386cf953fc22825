#pragma once

#include <string>
#include <vector>

namespace emb {

// Turns free text into a vector in the same space as the catalog matrix.
// Implementations own their own retries and timeouts.
class QueryEmbedder {
public:
    virtual ~QueryEmbedder() = default;
    virtual std::vector<float> embed(const std::string& text) const = 0;
};

}  // namespace emb
