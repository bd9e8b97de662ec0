#include "profile.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <cmath>
#include <set>
#include <spdlog/fmt/fmt.h>

namespace config {

    namespace {

        void require(bool condition, const std::string& message) {
            if (!condition) {
                throw core::ConfigException(message);
            }
        }

        void requireFinite(double value, const std::string& name) {
            require(std::isfinite(value), fmt::format("'{}' must be a finite number", name));
        }

        void requireNonNegative(double value, const std::string& name) {
            requireFinite(value, name);
            require(value >= 0.0, fmt::format("'{}' must not be negative (got {})", name, value));
        }

        // (0, 1]
        void requireFraction(double value, const std::string& name) {
            requireFinite(value, name);
            require(value > 0.0 && value <= 1.0, fmt::format("'{}' must be in (0, 1] (got {})", name, value));
        }

        void validateStages(const StageSettings& stages) {
            const auto& e = stages.earnings;
            requireFinite(e.growth_floor, "earnings.growth_floor");
            require(e.min_records >= 2, "earnings.min_records must be at least 2");

            const auto& f = stages.fundamental;
            requireNonNegative(f.min_market_cap, "fundamental.min_market_cap");
            requireNonNegative(f.max_market_cap, "fundamental.max_market_cap");
            require(f.min_market_cap <= f.max_market_cap,
                    fmt::format("fundamental.min_market_cap ({}) exceeds max_market_cap ({})",
                                f.min_market_cap, f.max_market_cap));
            requireFinite(f.growth_threshold, "fundamental.growth_threshold");
            requireFinite(f.prior_growth_floor, "fundamental.prior_growth_floor");

            const auto& w = stages.weekly;
            requireNonNegative(w.stability_tolerance, "weekly.stability_tolerance");
            requireNonNegative(w.low_distance_factor, "weekly.low_distance_factor");
            requireNonNegative(w.high_distance_factor, "weekly.high_distance_factor");

            const auto& rs = stages.relative_strength;
            require(!rs.field.empty(), "relative_strength.field must not be empty");
            requireFinite(rs.threshold, "relative_strength.threshold");
            require(rs.threshold >= 0.0 && rs.threshold <= 100.0,
                    fmt::format("relative_strength.threshold must be a percentile in [0, 100] (got {})", rs.threshold));

            const auto& d = stages.daily;
            require(!d.windows.empty(), "daily.windows must list at least one lookback window");
            std::set<std::string> labels;
            for (std::size_t i = 0; i < d.windows.size(); ++i) {
                const auto& window = d.windows[i];
                require(!window.label.empty(), "daily.windows entries need a label");
                require(window.bars > 0, fmt::format("daily window '{}' must span at least one bar", window.label));
                require(labels.insert(window.label).second, fmt::format("duplicate daily window label '{}'", window.label));
                if (i > 0) {
                    require(window.bars < d.windows[i - 1].bars,
                            "daily.windows must be ordered longest to shortest");
                }
            }
            require(d.stop_loss_fraction > 0.0 && d.stop_loss_fraction < 1.0,
                    fmt::format("daily.stop_loss_fraction must be in (0, 1) (got {})", d.stop_loss_fraction));
            requireFinite(d.min_long_ma_momentum, "daily.min_long_ma_momentum");
            if (d.alternate_rs_enabled) {
                require(labels.count(d.alternate_window_label) == 1,
                        fmt::format("daily.alternate_window_label '{}' is not a configured window", d.alternate_window_label));
            }
        }

        void validateExecution(const ExecutionConfig& x) {
            requireFinite(x.initial_cash, "execution.initial_cash");
            require(x.initial_cash > 0.0, "execution.initial_cash must be positive");
            require(x.max_positions > 0, "execution.max_positions must be at least 1");
            requireFraction(x.max_position_fraction, "execution.max_position_fraction");
            requireNonNegative(x.cash_reserve_fraction, "execution.cash_reserve_fraction");
            require(x.cash_reserve_fraction < 1.0, "execution.cash_reserve_fraction must be below 1");

            requireFraction(x.risk_per_trade, "execution.risk_per_trade");
            requireFraction(x.base_allocation, "execution.base_allocation");
            requireNonNegative(x.adr_high_threshold, "execution.adr_high_threshold");
            requireNonNegative(x.adr_low_threshold, "execution.adr_low_threshold");
            require(x.adr_low_threshold <= x.adr_high_threshold,
                    "execution.adr_low_threshold must not exceed adr_high_threshold");
            requireNonNegative(x.adr_high_scale, "execution.adr_high_scale");
            requireNonNegative(x.adr_low_scale, "execution.adr_low_scale");
            require(x.default_stop_fraction > 0.0 && x.default_stop_fraction < 1.0,
                    "execution.default_stop_fraction must be in (0, 1)");

            requireNonNegative(x.slippage, "execution.slippage");
            require(x.slippage < 1.0, "execution.slippage must be below 1");
            requireNonNegative(x.commission_rate, "execution.commission_rate");
            require(x.commission_rate < 1.0, "execution.commission_rate must be below 1");

            requireNonNegative(x.partial_exit_gain, "execution.partial_exit_gain");
            requireFraction(x.partial_exit_fraction, "execution.partial_exit_fraction");
            require(x.partial_exit_fraction < 1.0, "execution.partial_exit_fraction must leave a remainder (< 1)");
            requireNonNegative(x.partial_exit_risk_multiplier, "execution.partial_exit_risk_multiplier");

            require(x.max_pyramid_levels >= 0, "execution.max_pyramid_levels must not be negative");
            requireFraction(x.pyramid_fraction, "execution.pyramid_fraction");

            require(x.trailing_step > 0.0 && x.trailing_step < 1.0, "execution.trailing_step must be in (0, 1)");
            if (x.exit_signal_enabled) {
                require(!x.exit_signal_field.empty(), "execution.exit_signal_field must not be empty");
            }
        }

    } // end anonymous namespace

    void validate(const Profile& profile) {
        require(!profile.name.empty(), "profile name must not be empty");
        require(profile.worker_threads > 0, "worker_threads must be at least 1");
        requireFinite(profile.risk_free_rate, "risk_free_rate");
        validateStages(profile.stages);
        validateExecution(profile.execution);
        if (core::logging::isInitialized()) {
            core::logging::getLogger()->debug("Profile '{}' passed validation", profile.name);
        }
    }

} // namespace config
