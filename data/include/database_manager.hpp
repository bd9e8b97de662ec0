#pragma once

#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>

#include "datatypes.hpp"
#include "series_store.hpp"

namespace data {

    // One finished simulation, flattened for storage
    struct RunRecord {
        std::string profile_name;
        std::string mode;
        std::string status;
        std::string profile_json;
        std::string summary_json; // Empty when no summary was produced
        std::vector<core::Trade> trades;
        std::vector<core::EquityPoint> equity_history;
    };

    class DatabaseManager {
    public:
        // ":memory:" opens a private in-memory database
        explicit DatabaseManager(const std::string& db_path);
        ~DatabaseManager();

        DatabaseManager(const DatabaseManager&) = delete;
        DatabaseManager& operator=(const DatabaseManager&) = delete;

        bool connect();
        void disconnect();
        bool isConnected() const;

        bool initializeSchema();
        bool executeSQL(const std::string& sql);

        // --- Input side: bar series ---
        bool saveBars(const std::string& symbol, Timeframe timeframe,
                      const core::TimeSeries<core::SeriesBar>& bars);

        core::TimeSeries<core::SeriesBar> queryBars(const std::string& symbol,
                                                    Timeframe timeframe,
                                                    core::Timestamp start_time,
                                                    core::Timestamp end_time);

        // All timeframes for the given symbols (every stored symbol when empty)
        SeriesStore loadSeriesStore(const std::vector<std::string>& symbols = {});

        std::vector<std::string> listSymbols();

        // --- Output side: backtest results ---
        // Returns the new run id, or nullopt when the write was rolled back
        std::optional<long long> saveBacktestRun(const RunRecord& record);

        std::vector<core::Trade> queryTrades(long long run_id);
        std::vector<core::EquityPoint> queryEquity(long long run_id);

    private:
        // Prepared-statement helper: logs and returns nullptr on failure
        sqlite3_stmt* prepare(const char* sql);

        std::string database_path_;
        sqlite3* db_ = nullptr;
        bool connected_ = false;
    };

} // namespace data
