#include "pairwise_matrix.hpp"
#include "pair_similarity.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <thread>

namespace eventseq {

PairwiseMatrixProvider::PairwiseMatrixProvider(PairSimilarity& pairs, uint32_t group_size,
                                               std::chrono::milliseconds group_delay)
    : pairs_(pairs)
    , group_size_(group_size == 0 ? 1 : group_size)
    , group_delay_(group_delay)
{}

SimilarityMatrix PairwiseMatrixProvider::compute(const std::vector<Event>& events,
                                                 const std::vector<Frame>& frames) {
    SimilarityMatrix matrix(events.size(), frames.size());
    if (events.empty() || frames.empty()) return matrix;

    std::cerr << "[similarity] Pairwise matrix: " << events.size() << " events x "
              << frames.size() << " frames, groups of " << group_size_ << "\n";

    // Events run one after another; frames of one event run in groups.
    for (size_t e = 0; e < events.size(); ++e) {
        const std::string& text = events[e].description;

        for (size_t start = 0; start < frames.size(); start += group_size_) {
            size_t end = std::min(frames.size(), start + group_size_);

            std::vector<std::future<double>> group;
            group.reserve(end - start);
            for (size_t f = start; f < end; ++f) {
                const Frame& frame = frames[f];
                group.push_back(std::async(std::launch::async, [this, &frame, &text] {
                    return pairs_.lookup(frame, text);
                }));
            }

            for (size_t i = 0; i < group.size(); ++i) {
                matrix.set(e, start + i, group[i].get());
            }

            if (end < frames.size() && group_delay_.count() > 0) {
                std::this_thread::sleep_for(group_delay_);
            }
        }
    }

    return matrix;
}

} // namespace eventseq
