#pragma once
#include "types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace eventseq {

class HttpClient; // forward declare

// Access to keyframe retrieval and per-video frame listings.
// Implementations throw std::runtime_error when the service fails.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Top-K frames for a text query, best first.
    virtual std::vector<Frame> search_text(const std::string& query, uint32_t top_k,
                                           const std::optional<std::string>& video_id = std::nullopt) = 0;

    // Every keyframe of one video.
    virtual std::vector<Frame> video_frames(const std::string& video_id) = 0;
};

// Client for the retrieval service's REST API:
//   POST {base}/search/text?query=..&top_k=..[&video_id=..]
//   GET  {base}/video/{video_id}/frames
class HttpFrameSource : public FrameSource {
public:
    HttpFrameSource(std::string base_url, HttpClient& http, long timeout_seconds = 30);

    std::vector<Frame> search_text(const std::string& query, uint32_t top_k,
                                   const std::optional<std::string>& video_id = std::nullopt) override;
    std::vector<Frame> video_frames(const std::string& video_id) override;

private:
    std::string base_url_;
    HttpClient& http_;
    long timeout_seconds_;
};

// Parse one frame record. Requires id, video_id and keyframe_n;
// throws nlohmann::json::exception otherwise.
Frame frame_from_json(const nlohmann::json& j);

nlohmann::json to_json(const Frame& frame);

// Error text for a failed service response: the "detail" field when the
// body carries one, otherwise the status (or transport error).
std::string describe_failure(long status_code, const std::string& body);

} // namespace eventseq
