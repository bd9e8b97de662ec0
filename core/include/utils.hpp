#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Timestamp -> "YYYY-MM-DDTHH:MM:SSZ" (UTC)
    std::string timestampToString(const Timestamp& ts);

    // Timestamp -> "YYYY-MM-DD" (UTC calendar date)
    std::string timestampToDate(const Timestamp& ts);

    // Accepts "YYYY-MM-DD", or ISO 8601 with optional fraction and optional Z / +HH:MM offset.
    // A missing offset is read as UTC.
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Midnight UTC of the timestamp's calendar day
    Timestamp startOfDay(const Timestamp& ts);

    // Whole calendar days between two timestamps (b - a), fractional
    double daysBetween(const Timestamp& a, const Timestamp& b);

    // --- Enum <-> string ---
    std::string toString(Mode mode);
    Mode modeFromString(const std::string& text);

    std::string toString(Resolution resolution);
    Resolution resolutionFromString(const std::string& text);

    std::string toString(StageId stage);
    std::string toString(PositionState state);
    std::string toString(TradeType type);
    TradeType tradeTypeFromString(const std::string& text);
    std::string toString(ReasonCode reason);
    ReasonCode reasonFromString(const std::string& text);

} // namespace utils
} // namespace core
