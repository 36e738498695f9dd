#include "frame_source.hpp"
#include "http.hpp"
#include <stdexcept>

namespace eventseq {

static std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

HttpFrameSource::HttpFrameSource(std::string base_url, HttpClient& http, long timeout_seconds)
    : base_url_(strip_trailing_slash(std::move(base_url)))
    , http_(http)
    , timeout_seconds_(timeout_seconds)
{}

std::string describe_failure(long status_code, const std::string& body) {
    if (status_code == 0) {
        return "transport error" + (body.empty() ? std::string() : ": " + body);
    }
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_object() && j.contains("detail") && j["detail"].is_string()) {
        return "HTTP " + std::to_string(status_code) + ": " + j["detail"].get<std::string>();
    }
    return "HTTP " + std::to_string(status_code);
}

Frame frame_from_json(const nlohmann::json& j) {
    Frame f;
    f.id = j.at("id").get<int64_t>();
    f.video_id = j.at("video_id").get<std::string>();
    f.keyframe_n = j.at("keyframe_n").get<int64_t>();
    if (j.contains("pts_time") && j["pts_time"].is_number())
        f.pts_time = j["pts_time"].get<double>();
    if (j.contains("similarity") && j["similarity"].is_number())
        f.similarity = j["similarity"].get<double>();
    f.image_path = j.value("image_path", std::string{});
    f.image_filename = j.value("image_filename", std::string{});
    return f;
}

nlohmann::json to_json(const Frame& frame) {
    return {
        {"id", frame.id},
        {"video_id", frame.video_id},
        {"keyframe_n", frame.keyframe_n},
        {"pts_time", frame.pts_time},
        {"similarity", frame.similarity},
        {"image_path", frame.image_path},
        {"image_filename", frame.image_filename}
    };
}

static std::vector<Frame> parse_frames(const nlohmann::json& arr) {
    std::vector<Frame> frames;
    frames.reserve(arr.size());
    for (const auto& item : arr) {
        frames.push_back(frame_from_json(item));
    }
    return frames;
}

std::vector<Frame> HttpFrameSource::search_text(const std::string& query, uint32_t top_k,
                                                const std::optional<std::string>& video_id) {
    std::string url = base_url_ + "/search/text?query=" + url_encode(query) +
                      "&top_k=" + std::to_string(top_k);
    if (video_id) url += "&video_id=" + url_encode(*video_id);

    auto response = http_.post(url, "", {{"Accept", "application/json"}}, timeout_seconds_);
    if (!response.ok()) {
        throw std::runtime_error("text search failed: " +
                                 describe_failure(response.status_code, response.body));
    }

    try {
        auto j = nlohmann::json::parse(response.body);
        return parse_frames(j.at("results"));
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("text search returned malformed results: ") + e.what());
    }
}

std::vector<Frame> HttpFrameSource::video_frames(const std::string& video_id) {
    std::string url = base_url_ + "/video/" + url_encode(video_id) + "/frames";

    auto response = http_.get(url, {{"Accept", "application/json"}}, timeout_seconds_);
    if (!response.ok()) {
        throw std::runtime_error("frame listing for video " + video_id + " failed: " +
                                 describe_failure(response.status_code, response.body));
    }

    try {
        auto j = nlohmann::json::parse(response.body);
        if (!j.is_array()) {
            throw std::runtime_error("frame listing for video " + video_id + " is not an array");
        }
        return parse_frames(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("frame listing for video " + video_id +
                                 " is malformed: " + e.what());
    }
}

} // namespace eventseq
