#pragma once
#include <string>
#include <optional>
#include "event.hpp"

// Decode one NDJSON line:
//   {"time": <ISO8601>, "ip": <string>, "method": <string>, "lat_ms": <number>, "status": <int>}
// Missing time falls back to received_at, missing ip leaves source_id empty,
// missing lat_ms is 0 and missing status is 200. Returns nullopt for anything
// that is not an object with a string method and sane numeric fields.
std::optional<Event> parse_event_line(const std::string &line, const std::string &salt, double received_at);

// "2025-03-01T12:00:00Z", "2025-03-01T12:00:00.25+02:00", ... -> unix seconds.
std::optional<double> parse_iso8601(const std::string &s);
