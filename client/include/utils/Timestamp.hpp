#pragma once
#include <cstdint>
#include <optional>
#include <string>

// Parses ISO-8601 date-times as stored by the user service:
//   2024-05-01, 2024-05-01T12:30:00, 2024-05-01 12:30:00.123456,
//   2024-05-01T12:30:00Z, 2024-05-01T12:30:00+10:00
// Values without an offset are taken as UTC. Returns epoch milliseconds,
// or nullopt when the text is not a valid date-time.
std::optional<std::int64_t> parseIsoTimestampMs(const std::string& text);

// Current wall-clock time as "YYYY-MM-DDTHH:MM:SS" (local time).
std::string nowIso8601();
