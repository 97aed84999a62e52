#pragma once

#include "chunkgate/events/events.hpp"
#include "chunkgate/transfer/types.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace chunkgate::transfer {

nlohmann::json window_to_json(const WindowSnapshot& window);

nlohmann::json report_to_json(const TransferReport& report);

/**
 * @brief Live view of the store plus the latest events
 *
 * { "state": { "<key>": { "name", "left", "right", "total_length", "chunk_size" } },
 *   "events": [ { "key", "kind" } ] }
 */
nlohmann::json status_to_json(const std::vector<WindowSnapshot>& windows,
                              const std::vector<events::TransferEvent>& recent);

} // namespace chunkgate::transfer
