#include "fallback_matrix.hpp"
#include <iostream>
#include <stdexcept>

namespace eventseq {

FallbackMatrixProvider::FallbackMatrixProvider(
    std::vector<std::unique_ptr<SimilarityMatrixProvider>> providers, uint32_t max_retries)
    : providers_(std::move(providers)), max_retries_(max_retries == 0 ? 1 : max_retries) {
    if (providers_.empty()) {
        throw std::invalid_argument("FallbackMatrixProvider requires at least one provider");
    }
}

SimilarityMatrix FallbackMatrixProvider::compute(const std::vector<Event>& events,
                                                 const std::vector<Frame>& frames) {
    std::string last_error;
    for (size_t i = 0; i < providers_.size(); ++i) {
        for (uint32_t retry = 0; retry < max_retries_; ++retry) {
            try {
                SimilarityMatrix matrix = providers_[i]->compute(events, frames);
                last_provider_ = providers_[i]->provider_name();
                return matrix;
            } catch (const std::exception& e) {
                last_error = e.what();
                std::cerr << "[similarity] Provider " << providers_[i]->provider_name()
                          << " attempt " << (retry + 1) << "/" << max_retries_
                          << " failed: " << last_error << '\n';
            }
        }
    }
    throw std::runtime_error("All similarity providers failed. Last error: " + last_error);
}

} // namespace eventseq
