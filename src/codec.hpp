#pragma once

#include "types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portgate {

// Keys keep insertion order so the wire format matches the dashboard's field order.
using Json = nlohmann::ordered_json;

// RFC 3339 in UTC, e.g. 2024-05-01T12:00:00Z.
std::string format_timestamp(Clock::time_point tp);
// Accepts RFC 3339 with optional fractional seconds and Z/+hh:mm offsets.
std::optional<Clock::time_point> parse_timestamp(std::string_view text);

void to_json(Json& j, const DiscoveredPort& port);
void to_json(Json& j, const ManualPort& port);
void to_json(Json& j, const ScanRange& range);
void to_json(Json& j, const DomainMapping& mapping);

// Serializes with invalid UTF-8 replaced by U+FFFD; indent < 0 is compact.
std::string dump_json(const Json& value, int indent = -1);

std::string to_json(const DiscoveredPort& port);
std::string to_json(const ManualPort& port);
std::string to_json(const ScanRange& range);
std::string to_json(const DomainMapping& mapping);

std::string to_json(const std::vector<DiscoveredPort>& ports);
std::string to_json(const std::vector<ManualPort>& ports);
std::string to_json(const std::vector<ScanRange>& ranges);
std::string to_json(const std::vector<DomainMapping>& mappings);

// {"type":"update","data":{...}} envelope delivered to subscribers.
std::string render_update(const StateUpdate& update);

} // namespace portgate
