#pragma once
#include "matrix_provider.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace eventseq {

// Wraps multiple matrix strategies with retry/fallback logic: each
// strategy is tried up to max_retries times, in order, until one succeeds.
class FallbackMatrixProvider : public SimilarityMatrixProvider {
public:
    explicit FallbackMatrixProvider(std::vector<std::unique_ptr<SimilarityMatrixProvider>> providers,
                                    uint32_t max_retries = 1);

    SimilarityMatrix compute(const std::vector<Event>& events,
                             const std::vector<Frame>& frames) override;

    std::string provider_name() const override { return "fallback"; }

    // Name of the strategy that produced the most recent matrix.
    const std::string& last_provider() const { return last_provider_; }

private:
    std::vector<std::unique_ptr<SimilarityMatrixProvider>> providers_;
    uint32_t max_retries_;
    std::string last_provider_;
};

} // namespace eventseq
