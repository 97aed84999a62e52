#include "chunkgate/transfer/status.hpp"

namespace chunkgate::transfer {

using json = nlohmann::json;

json window_to_json(const WindowSnapshot& window) {
    json j;
    j["name"] = window.name;
    j["left"] = window.left;
    j["right"] = window.right;
    j["total_length"] = window.total_length;
    j["chunk_size"] = window.chunk_size;
    j["chunk_index"] = window.chunk_index;
    j["chunk_count"] = window.chunk_count;
    j["bytes_acknowledged"] = window.bytes_acknowledged;
    return j;
}

json report_to_json(const TransferReport& report) {
    json j;
    j["key"] = report.key;
    j["outcome"] = to_string(report.outcome);
    j["chunks_delivered"] = report.chunks_delivered;
    j["bytes_delivered"] = report.bytes_delivered;
    j["failures"] = report.failures;
    j["last_error"] = report.last_error;
    j["duration_ms"] = report.duration.count();
    return j;
}

json status_to_json(const std::vector<WindowSnapshot>& windows,
                    const std::vector<events::TransferEvent>& recent) {
    json state = json::object();
    for (const auto& window : windows) {
        state[window.key] = window_to_json(window);
    }

    json history = json::array();
    for (const auto& event : recent) {
        history.push_back(json{{"key", event.key}, {"kind", events::to_string(event.kind)}});
    }

    return json{{"state", state}, {"events", history}};
}

} // namespace chunkgate::transfer
