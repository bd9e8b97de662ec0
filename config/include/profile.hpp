#pragma once

#include <string>
#include <vector>
#include <cstddef>

#include "datatypes.hpp"

namespace config {

    // --- Stage Settings ---

    struct EarningsStageConfig {
        bool enabled = true;
        // Prior-period YoY growth must be at least this (as a ratio, 0.0 = flat)
        double growth_floor = 0.0;
        std::size_t min_records = 2;
    };

    struct FundamentalStageConfig {
        bool enabled = true;
        double min_market_cap = 2e9;
        double max_market_cap = 2e13;
        double growth_threshold = 0.1;   // Latest REV_YOY / EPS_YOY
        double prior_growth_floor = 0.0; // Prior-record REV_YOY / EPS_YOY
    };

    struct WeeklyStageConfig {
        bool enabled = true;
        double stability_tolerance = 0.05;  // 52_H may drift up to 5% over two weeks
        double low_distance_factor = 1.3;   // close > 52_L * 1.3
        double high_distance_factor = 0.7;  // close > 52_H * 0.7
    };

    struct RelativeStrengthStageConfig {
        bool enabled = true;
        std::string field = core::fields::RS_4W;
        double threshold = 90.0;
    };

    struct LookbackWindow {
        std::string label;
        std::size_t bars = 0;
    };

    struct DailyBreakoutStageConfig {
        bool enabled = true;
        // Ordered longest first
        std::vector<LookbackWindow> windows = {
            {"2Y", 400}, {"1Y", 200}, {"6M", 100}, {"3M", 50}, {"1M", 20}
        };
        double stop_loss_fraction = 0.03;
        double min_long_ma_momentum = 0.0;
        std::string short_ma_field = core::fields::SMA50;
        std::string long_ma_field = core::fields::SMA200;
        std::string momentum_field = core::fields::SMA200_M;
        // Secondary path: strong 12-week RS on a short window when the trend gate fails
        bool alternate_rs_enabled = false;
        std::string alternate_rs_field = core::fields::RS_12W;
        std::string alternate_window_label = "1M";
    };

    struct StageSettings {
        EarningsStageConfig earnings;
        FundamentalStageConfig fundamental;
        WeeklyStageConfig weekly;
        RelativeStrengthStageConfig relative_strength;
        DailyBreakoutStageConfig daily;
    };

    // --- Execution Settings ---

    struct ExecutionConfig {
        double initial_cash = 100000.0;
        std::size_t max_positions = 10;
        double max_position_fraction = 0.25;
        double cash_reserve_fraction = 0.0;

        // Sizing
        double risk_per_trade = 0.03;       // Equity fraction lost if the stop is hit
        double base_allocation = 0.2;       // Equity fraction per position before ADR scaling
        double adr_high_threshold = 5.0;
        double adr_high_scale = 0.5;
        double adr_low_threshold = 2.0;
        double adr_low_scale = 1.5;
        double default_stop_fraction = 0.03; // Used when a candidate carries no stop

        // Costs
        double slippage = 0.002;
        double commission_rate = 0.0;

        // Partial exit
        bool partial_exit_enabled = true;
        double partial_exit_gain = 0.20;
        double partial_exit_fraction = 0.5;
        double partial_exit_risk_multiplier = 2.0;

        // Pyramiding
        bool pyramiding_enabled = false;
        int max_pyramid_levels = 2;
        double pyramid_fraction = 0.5; // Of current quantity

        // Stops and exits
        bool trailing_stop_enabled = true;
        double trailing_step = 0.05;
        bool same_step_stop = true;
        bool exit_signal_enabled = true;
        std::string exit_signal_field = core::fields::SMA20;

        bool close_positions_at_end = false;
    };

    // --- Named Profile ---
    struct Profile {
        std::string name = "default";
        core::Mode mode = core::Mode::Retrospective;
        core::Resolution resolution = core::Resolution::Daily;
        std::size_t worker_threads = 4;
        double risk_free_rate = 0.02;
        StageSettings stages;
        ExecutionConfig execution;
    };

    // Throws core::ConfigException on the first invalid value
    void validate(const Profile& profile);

} // namespace config
