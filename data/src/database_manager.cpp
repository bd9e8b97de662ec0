#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>
#include <cmath>
#include <stdexcept>

namespace data
{

    using json = nlohmann::json;

    namespace
    {

        std::string fieldsToJson(const std::map<std::string, double>& fields)
        {
            json obj = json::object();
            for (const auto& pair : fields)
            {
                // JSON has no NaN/Inf; a non-finite field is stored as null and reads back as absent
                if (std::isfinite(pair.second))
                    obj[pair.first] = pair.second;
                else
                    obj[pair.first] = nullptr;
            }
            return obj.dump();
        }

        std::map<std::string, double> fieldsFromJson(const char* text)
        {
            std::map<std::string, double> fields;
            if (!text)
                return fields;
            json obj = json::parse(text);
            for (auto it = obj.begin(); it != obj.end(); ++it)
            {
                if (it.value().is_number())
                    fields[it.key()] = it.value().get<double>();
            }
            return fields;
        }

        std::string columnText(sqlite3_stmt* stmt, int col)
        {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            return text ? reinterpret_cast<const char*>(text) : std::string();
        }

    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string& db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000);
        return executeSQL("PRAGMA foreign_keys = ON;");
    }

    void DatabaseManager::disconnect()
    {
        if (connected_)
        {
            core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
            int rc = sqlite3_close(db_);
            if (rc != SQLITE_OK)
            {
                // Usually an unfinalized prepared statement
                core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
            }
            db_ = nullptr;
            connected_ = false;
        }
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string& sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char* error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    sqlite3_stmt* DatabaseManager::prepare(const char* sql)
    {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Failed to prepare SQL statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return nullptr;
        }
        return stmt;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        const std::string create_bars_sql = R"(
        CREATE TABLE IF NOT EXISTS series_bars (
            symbol TEXT NOT NULL,
            timeframe TEXT NOT NULL,   -- day, week, fundamental, earnings, minute
            timestamp TEXT NOT NULL,   -- ISO 8601 UTC
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            volume INTEGER,
            fields_json TEXT,          -- Named indicator / fundamental fields
            PRIMARY KEY (symbol, timeframe, timestamp)
        );
    )";

        const std::string create_runs_sql = R"(
        CREATE TABLE IF NOT EXISTS backtest_runs (
            run_id INTEGER PRIMARY KEY AUTOINCREMENT,
            profile_name TEXT NOT NULL,
            mode TEXT NOT NULL,
            status TEXT NOT NULL,
            created_at TEXT NOT NULL,
            profile_json TEXT,
            summary_json TEXT
        );
    )";

        const std::string create_trades_sql = R"(
        CREATE TABLE IF NOT EXISTS backtest_trades (
            run_id INTEGER NOT NULL REFERENCES backtest_runs(run_id) ON DELETE CASCADE,
            sequence INTEGER NOT NULL,
            position_id INTEGER,
            ticker TEXT NOT NULL,
            type TEXT NOT NULL,
            quantity INTEGER,
            price REAL,
            timestamp TEXT NOT NULL,
            reason TEXT,
            realized_pnl REAL,
            commission REAL,
            PRIMARY KEY (run_id, sequence)
        );
    )";

        const std::string create_equity_sql = R"(
        CREATE TABLE IF NOT EXISTS backtest_equity (
            run_id INTEGER NOT NULL REFERENCES backtest_runs(run_id) ON DELETE CASCADE,
            timestamp TEXT NOT NULL,
            total_equity REAL,
            cash REAL,
            positions_value REAL,
            open_positions INTEGER,
            PRIMARY KEY (run_id, timestamp)
        );
    )";

        bool success = true;
        success &= executeSQL(create_bars_sql);
        success &= executeSQL(create_runs_sql);
        success &= executeSQL(create_trades_sql);
        success &= executeSQL(create_equity_sql);

        if (success)
        {
            core::logging::getLogger()->info("SQLite database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    bool DatabaseManager::saveBars(const std::string& symbol, Timeframe timeframe,
                                   const core::TimeSeries<core::SeriesBar>& bars)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save bars: Not connected to database.");
            return false;
        }
        if (bars.empty())
        {
            return true;
        }

        // Newer values for an existing key replace the stored row
        sqlite3_stmt* stmt = prepare(R"(
INSERT OR REPLACE INTO series_bars
(symbol, timeframe, timestamp, open, high, low, close, volume, fields_json)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
)");
        if (!stmt)
            return false;

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            sqlite3_finalize(stmt);
            return false;
        }

        const std::string timeframe_str = timeframeToString(timeframe);
        bool success = true;
        for (const auto& bar : bars)
        {
            std::string timestamp_str = core::utils::timestampToString(bar.timestamp);
            std::string fields_str = fieldsToJson(bar.fields);

            sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, timeframe_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 4, bar.open);
            sqlite3_bind_double(stmt, 5, bar.high);
            sqlite3_bind_double(stmt, 6, bar.low);
            sqlite3_bind_double(stmt, 7, bar.close);
            sqlite3_bind_int64(stmt, 8, bar.volume);
            sqlite3_bind_text(stmt, 9, fields_str.c_str(), -1, SQLITE_TRANSIENT);

            int rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }

        sqlite3_finalize(stmt);

        if (success)
        {
            success = executeSQL("COMMIT;");
            if (!success)
                executeSQL("ROLLBACK;");
        }
        else
        {
            executeSQL("ROLLBACK;");
            logger->warn("Transaction rolled back while saving {} bars for {}.", timeframe_str, symbol);
        }

        if (success)
            logger->debug("Saved {} {} bars for {}.", bars.size(), timeframe_str, symbol);
        return success;
    }

    core::TimeSeries<core::SeriesBar> DatabaseManager::queryBars(const std::string& symbol,
                                                                 Timeframe timeframe,
                                                                 core::Timestamp start_time,
                                                                 core::Timestamp end_time)
    {
        core::TimeSeries<core::SeriesBar> bars;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query bars: Not connected to database.");
            return bars;
        }

        // UTC ISO strings sort lexicographically in time order
        std::string start_str = core::utils::timestampToString(start_time);
        std::string end_str = core::utils::timestampToString(end_time);
        std::string timeframe_str = timeframeToString(timeframe);

        sqlite3_stmt* stmt = prepare(R"(
            SELECT timestamp, open, high, low, close, volume, fields_json
            FROM series_bars
            WHERE symbol = ? AND timeframe = ? AND timestamp >= ? AND timestamp <= ?
            ORDER BY timestamp ASC;
        )");
        if (!stmt)
            return bars;

        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, timeframe_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, end_str.c_str(), -1, SQLITE_TRANSIENT);

        int rc;
        int row_count = 0;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            row_count++;
            try
            {
                core::SeriesBar bar;
                bar.timestamp = core::utils::stringToTimestamp(columnText(stmt, 0));
                bar.open = sqlite3_column_double(stmt, 1);
                bar.high = sqlite3_column_double(stmt, 2);
                bar.low = sqlite3_column_double(stmt, 3);
                bar.close = sqlite3_column_double(stmt, 4);
                bar.volume = sqlite3_column_int64(stmt, 5);
                bar.fields = fieldsFromJson(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 6)));
                bars.push_back(std::move(bar));
            }
            catch (const std::exception& e)
            {
                // A malformed row drops that bar only
                logger->error("Error processing {} row {} for {}: {}", timeframe_str, row_count, symbol, e.what());
            }
        }

        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through query results [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return bars;
    }

    std::vector<std::string> DatabaseManager::listSymbols()
    {
        std::vector<std::string> symbols;
        if (!isConnected())
            return symbols;
        sqlite3_stmt* stmt = prepare("SELECT DISTINCT symbol FROM series_bars ORDER BY symbol ASC;");
        if (!stmt)
            return symbols;
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            symbols.push_back(columnText(stmt, 0));
        }
        sqlite3_finalize(stmt);
        return symbols;
    }

    SeriesStore DatabaseManager::loadSeriesStore(const std::vector<std::string>& symbols)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot load series store: Not connected to database.");
        }

        std::vector<std::string> wanted = symbols.empty() ? listSymbols() : symbols;
        const core::Timestamp earliest = core::utils::stringToTimestamp("1900-01-01");
        const core::Timestamp latest = core::utils::stringToTimestamp("2999-12-31");
        const Timeframe timeframes[] = {Timeframe::Daily, Timeframe::Weekly, Timeframe::Fundamental,
                                        Timeframe::Earnings, Timeframe::Minute};

        SeriesStore store;
        for (const auto& symbol : wanted)
        {
            SymbolSeries& series = store.upsert(symbol);
            for (Timeframe timeframe : timeframes)
            {
                series.setSeries(timeframe, queryBars(symbol, timeframe, earliest, latest));
            }
        }
        logger->info("Loaded series for {} symbols from {}", store.size(), database_path_);
        return store;
    }

    std::optional<long long> DatabaseManager::saveBacktestRun(const RunRecord& record)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save backtest run: Not connected to database.");
            return std::nullopt;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
            return std::nullopt;

        bool success = true;
        long long run_id = 0;

        // --- Run header ---
        sqlite3_stmt* run_stmt = prepare(R"(
INSERT INTO backtest_runs (profile_name, mode, status, created_at, profile_json, summary_json)
VALUES (?, ?, ?, ?, ?, ?);
)");
        if (!run_stmt)
        {
            executeSQL("ROLLBACK;");
            return std::nullopt;
        }
        std::string created_at = core::utils::timestampToString(std::chrono::system_clock::now());
        sqlite3_bind_text(run_stmt, 1, record.profile_name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(run_stmt, 2, record.mode.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(run_stmt, 3, record.status.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(run_stmt, 4, created_at.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(run_stmt, 5, record.profile_json.c_str(), -1, SQLITE_TRANSIENT);
        if (record.summary_json.empty())
            sqlite3_bind_null(run_stmt, 6);
        else
            sqlite3_bind_text(run_stmt, 6, record.summary_json.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(run_stmt) != SQLITE_DONE)
        {
            logger->error("Failed to insert backtest run: {}", sqlite3_errmsg(db_));
            success = false;
        }
        else
        {
            run_id = sqlite3_last_insert_rowid(db_);
        }
        sqlite3_finalize(run_stmt);

        // --- Trade log ---
        if (success)
        {
            sqlite3_stmt* stmt = prepare(R"(
INSERT INTO backtest_trades
(run_id, sequence, position_id, ticker, type, quantity, price, timestamp, reason, realized_pnl, commission)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
)");
            success = stmt != nullptr;
            for (const auto& trade : record.trades)
            {
                if (!success)
                    break;
                std::string ts = core::utils::timestampToString(trade.timestamp);
                std::string type = core::utils::toString(trade.type);
                std::string reason = core::utils::toString(trade.reason);
                sqlite3_bind_int64(stmt, 1, run_id);
                sqlite3_bind_int64(stmt, 2, trade.sequence);
                sqlite3_bind_int(stmt, 3, trade.position_id);
                sqlite3_bind_text(stmt, 4, trade.ticker.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt, 5, type.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_int64(stmt, 6, trade.quantity);
                sqlite3_bind_double(stmt, 7, trade.price);
                sqlite3_bind_text(stmt, 8, ts.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt, 9, reason.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_double(stmt, 10, trade.realized_pnl);
                sqlite3_bind_double(stmt, 11, trade.commission);
                if (sqlite3_step(stmt) != SQLITE_DONE)
                {
                    logger->error("Failed to insert trade {}: {}", trade.sequence, sqlite3_errmsg(db_));
                    success = false;
                }
                sqlite3_reset(stmt);
            }
            sqlite3_finalize(stmt);
        }

        // --- Equity history ---
        if (success)
        {
            sqlite3_stmt* stmt = prepare(R"(
INSERT INTO backtest_equity (run_id, timestamp, total_equity, cash, positions_value, open_positions)
VALUES (?, ?, ?, ?, ?, ?);
)");
            success = stmt != nullptr;
            for (const auto& point : record.equity_history)
            {
                if (!success)
                    break;
                std::string ts = core::utils::timestampToString(point.timestamp);
                sqlite3_bind_int64(stmt, 1, run_id);
                sqlite3_bind_text(stmt, 2, ts.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_double(stmt, 3, point.total_equity);
                sqlite3_bind_double(stmt, 4, point.cash);
                sqlite3_bind_double(stmt, 5, point.positions_value);
                sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(point.open_positions));
                if (sqlite3_step(stmt) != SQLITE_DONE)
                {
                    logger->error("Failed to insert equity point {}: {}", ts, sqlite3_errmsg(db_));
                    success = false;
                }
                sqlite3_reset(stmt);
            }
            sqlite3_finalize(stmt);
        }

        if (!success || !executeSQL("COMMIT;"))
        {
            executeSQL("ROLLBACK;");
            logger->error("Backtest run '{}' was not saved; transaction rolled back.", record.profile_name);
            return std::nullopt;
        }

        logger->info("Saved backtest run {} ('{}'): {} trades, {} equity points.",
                     run_id, record.profile_name, record.trades.size(), record.equity_history.size());
        return run_id;
    }

    std::vector<core::Trade> DatabaseManager::queryTrades(long long run_id)
    {
        std::vector<core::Trade> trades;
        if (!isConnected())
            return trades;

        sqlite3_stmt* stmt = prepare(R"(
            SELECT sequence, position_id, ticker, type, quantity, price, timestamp, reason, realized_pnl, commission
            FROM backtest_trades WHERE run_id = ? ORDER BY sequence ASC;
        )");
        if (!stmt)
            return trades;
        sqlite3_bind_int64(stmt, 1, run_id);

        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            core::Trade trade;
            trade.sequence = sqlite3_column_int64(stmt, 0);
            trade.position_id = sqlite3_column_int(stmt, 1);
            trade.ticker = columnText(stmt, 2);
            trade.type = core::utils::tradeTypeFromString(columnText(stmt, 3));
            trade.quantity = sqlite3_column_int64(stmt, 4);
            trade.price = sqlite3_column_double(stmt, 5);
            trade.timestamp = core::utils::stringToTimestamp(columnText(stmt, 6));
            trade.reason = core::utils::reasonFromString(columnText(stmt, 7));
            trade.realized_pnl = sqlite3_column_double(stmt, 8);
            trade.commission = sqlite3_column_double(stmt, 9);
            trades.push_back(std::move(trade));
        }
        sqlite3_finalize(stmt);
        return trades;
    }

    std::vector<core::EquityPoint> DatabaseManager::queryEquity(long long run_id)
    {
        std::vector<core::EquityPoint> points;
        if (!isConnected())
            return points;

        sqlite3_stmt* stmt = prepare(R"(
            SELECT timestamp, total_equity, cash, positions_value, open_positions
            FROM backtest_equity WHERE run_id = ? ORDER BY timestamp ASC;
        )");
        if (!stmt)
            return points;
        sqlite3_bind_int64(stmt, 1, run_id);

        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            core::EquityPoint point;
            point.timestamp = core::utils::stringToTimestamp(columnText(stmt, 0));
            point.total_equity = sqlite3_column_double(stmt, 1);
            point.cash = sqlite3_column_double(stmt, 2);
            point.positions_value = sqlite3_column_double(stmt, 3);
            point.open_positions = static_cast<std::size_t>(sqlite3_column_int64(stmt, 4));
            points.push_back(point);
        }
        sqlite3_finalize(stmt);
        return points;
    }

} // namespace data
