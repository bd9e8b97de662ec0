#include "utils.hpp"
#include "exceptions.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>
#include <string>
#include <cmath>      // For std::pow
#include <cctype>
#include <algorithm>
#include <ctime>

namespace core {
namespace utils {

    namespace {

        std::string lowercase(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                [](unsigned char c){ return std::tolower(c); });
            return text;
        }

        std::tm toUtcTm(const Timestamp& ts) {
            auto tt = std::chrono::system_clock::to_time_t(ts);
            std::tm time_tm{};
            #ifdef _WIN32
                gmtime_s(&time_tm, &tt);
            #else
                gmtime_r(&tt, &time_tm);
            #endif
            return time_tm;
        }

    } // end anonymous namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Date part, always required
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw DataLoadException("Failed to parse timestamp (date part): " + iso_string);
        }

        // 2. Optional time part
        double fractional_seconds = 0.0;
        std::chrono::seconds offset_duration(0);
        if (ss.peek() == 'T' || ss.peek() == ' ') {
            ss.ignore();
            ss >> std::get_time(&tm, "%H:%M:%S");
            if (ss.fail()) {
                throw DataLoadException("Failed to parse timestamp (time part): " + iso_string);
            }

            // Optional fractional seconds
            if (ss.peek() == '.') {
                ss.ignore();
                std::string digits;
                while (std::isdigit(ss.peek()) && digits.size() < 9) {
                    digits += static_cast<char>(ss.get());
                }
                while (std::isdigit(ss.peek())) {
                    ss.ignore();
                }
                if (!digits.empty()) {
                    fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
                }
            }

            // Optional timezone offset (+HH:MM, -HH:MM, or Z)
            char sign_or_z = 0;
            if (ss >> sign_or_z) {
                if (sign_or_z == 'Z') {
                    offset_duration = std::chrono::seconds(0);
                } else if (sign_or_z == '+' || sign_or_z == '-') {
                    int offset_h = 0;
                    int offset_m = 0;
                    char colon = ' ';
                    if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                         throw DataLoadException("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                    }
                    offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                    if (sign_or_z == '-') {
                        offset_duration *= -1;
                    }
                } else {
                    throw DataLoadException("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
                }
            }
        }

        // timegm interprets struct tm as UTC
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == static_cast<time_t>(-1)) {
             throw DataLoadException("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2015-04-20T00:00:00+05:30 -> 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << "Z";
        return oss.str();
    }

    std::string timestampToDate(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

    Timestamp startOfDay(const Timestamp& ts) {
        return stringToTimestamp(timestampToDate(ts));
    }

    double daysBetween(const Timestamp& a, const Timestamp& b) {
        std::chrono::duration<double, std::ratio<86400>> days = b - a;
        return days.count();
    }

    // --- Enum <-> string ---

    std::string toString(Mode mode) {
        return mode == Mode::Forward ? "forward" : "retrospective";
    }

    Mode modeFromString(const std::string& text) {
        std::string lower = lowercase(text);
        if (lower == "retrospective" || lower == "backtest") return Mode::Retrospective;
        if (lower == "forward" || lower == "live") return Mode::Forward;
        throw ConfigException("Unknown mode string: " + text);
    }

    std::string toString(Resolution resolution) {
        return resolution == Resolution::Minute ? "minute" : "daily";
    }

    Resolution resolutionFromString(const std::string& text) {
        std::string lower = lowercase(text);
        if (lower == "daily" || lower == "day") return Resolution::Daily;
        if (lower == "minute" || lower == "intraday") return Resolution::Minute;
        throw ConfigException("Unknown resolution string: " + text);
    }

    std::string toString(StageId stage) {
        switch (stage) {
            case StageId::Earnings:         return "E";
            case StageId::Fundamental:      return "F";
            case StageId::Weekly:           return "W";
            case StageId::RelativeStrength: return "RS";
            case StageId::DailyBreakout:    return "D";
        }
        return "?";
    }

    std::string toString(PositionState state) {
        switch (state) {
            case PositionState::Open:            return "Open";
            case PositionState::PartiallyClosed: return "PartiallyClosed";
            case PositionState::Closed:          return "Closed";
        }
        return "?";
    }

    std::string toString(TradeType type) {
        switch (type) {
            case TradeType::Entry:       return "Entry";
            case TradeType::Exit:        return "Exit";
            case TradeType::PartialExit: return "PartialExit";
            case TradeType::Pyramid:     return "Pyramid";
            case TradeType::StopOut:     return "StopOut";
            case TradeType::Rejected:    return "Rejected";
        }
        return "?";
    }

    TradeType tradeTypeFromString(const std::string& text) {
        const TradeType all[] = {TradeType::Entry, TradeType::Exit, TradeType::PartialExit,
                                 TradeType::Pyramid, TradeType::StopOut, TradeType::Rejected};
        for (TradeType type : all) {
            if (toString(type) == text) return type;
        }
        throw DataLoadException("Unknown trade type string: " + text);
    }

    std::string toString(ReasonCode reason) {
        switch (reason) {
            case ReasonCode::Breakout:           return "Breakout";
            case ReasonCode::MarketEntry:        return "MarketEntry";
            case ReasonCode::PyramidAdd:         return "PyramidAdd";
            case ReasonCode::StopLoss:           return "StopLoss";
            case ReasonCode::TrailingStop:       return "TrailingStop";
            case ReasonCode::SignalExit:         return "SignalExit";
            case ReasonCode::TargetReached:      return "TargetReached";
            case ReasonCode::Whipsaw:            return "Whipsaw";
            case ReasonCode::WhipsawGuard:       return "WhipsawGuard";
            case ReasonCode::CapacityLimit:      return "CapacityLimit";
            case ReasonCode::ConcentrationLimit: return "ConcentrationLimit";
            case ReasonCode::InsufficientCash:   return "InsufficientCash";
            case ReasonCode::InvalidSizing:      return "InvalidSizing";
            case ReasonCode::EndOfRun:           return "EndOfRun";
        }
        return "?";
    }

    ReasonCode reasonFromString(const std::string& text) {
        for (int i = static_cast<int>(ReasonCode::Breakout); i <= static_cast<int>(ReasonCode::EndOfRun); ++i) {
            ReasonCode reason = static_cast<ReasonCode>(i);
            if (toString(reason) == text) return reason;
        }
        throw DataLoadException("Unknown reason code string: " + text);
    }

} // namespace utils
} // namespace core
