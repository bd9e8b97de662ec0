#include "profile_loader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <fstream>
#include <spdlog/fmt/fmt.h>

namespace config {

    namespace { // File-local readers

        const json* section(const json& parent, const char* key) {
            if (!parent.contains(key)) {
                return nullptr;
            }
            const json& child = parent.at(key);
            if (!child.is_object()) {
                throw core::ConfigException(fmt::format("'{}' must be an object", key));
            }
            return &child;
        }

        void read(const json& obj, const char* key, double& out) {
            if (!obj.contains(key)) return;
            if (!obj.at(key).is_number()) {
                throw core::ConfigException(fmt::format("'{}' must be a number", key));
            }
            out = obj.at(key).get<double>();
        }

        void read(const json& obj, const char* key, bool& out) {
            if (!obj.contains(key)) return;
            if (!obj.at(key).is_boolean()) {
                throw core::ConfigException(fmt::format("'{}' must be a boolean", key));
            }
            out = obj.at(key).get<bool>();
        }

        void read(const json& obj, const char* key, std::string& out) {
            if (!obj.contains(key)) return;
            if (!obj.at(key).is_string()) {
                throw core::ConfigException(fmt::format("'{}' must be a string", key));
            }
            out = obj.at(key).get<std::string>();
        }

        void read(const json& obj, const char* key, std::size_t& out) {
            if (!obj.contains(key)) return;
            const json& value = obj.at(key);
            if (!value.is_number_integer() || value.get<long long>() < 0) {
                throw core::ConfigException(fmt::format("'{}' must be a non-negative integer", key));
            }
            out = value.get<std::size_t>();
        }

        void read(const json& obj, const char* key, int& out) {
            if (!obj.contains(key)) return;
            if (!obj.at(key).is_number_integer()) {
                throw core::ConfigException(fmt::format("'{}' must be an integer", key));
            }
            out = obj.at(key).get<int>();
        }

        std::vector<LookbackWindow> readWindows(const json& windows) {
            if (!windows.is_array()) {
                throw core::ConfigException("'windows' must be an array of {label, bars}");
            }
            std::vector<LookbackWindow> parsed;
            for (const auto& entry : windows) {
                if (!entry.is_object() || !entry.contains("label") || !entry.contains("bars")) {
                    throw core::ConfigException("each lookback window needs 'label' and 'bars'");
                }
                LookbackWindow window;
                read(entry, "label", window.label);
                read(entry, "bars", window.bars);
                parsed.push_back(window);
            }
            return parsed;
        }

        void readStages(const json& stages, StageSettings& out) {
            if (const json* e = section(stages, "earnings")) {
                read(*e, "enabled", out.earnings.enabled);
                read(*e, "growth_floor", out.earnings.growth_floor);
                read(*e, "min_records", out.earnings.min_records);
            }
            if (const json* f = section(stages, "fundamental")) {
                read(*f, "enabled", out.fundamental.enabled);
                read(*f, "min_market_cap", out.fundamental.min_market_cap);
                read(*f, "max_market_cap", out.fundamental.max_market_cap);
                read(*f, "growth_threshold", out.fundamental.growth_threshold);
                read(*f, "prior_growth_floor", out.fundamental.prior_growth_floor);
            }
            if (const json* w = section(stages, "weekly")) {
                read(*w, "enabled", out.weekly.enabled);
                read(*w, "stability_tolerance", out.weekly.stability_tolerance);
                read(*w, "low_distance_factor", out.weekly.low_distance_factor);
                read(*w, "high_distance_factor", out.weekly.high_distance_factor);
            }
            if (const json* rs = section(stages, "relative_strength")) {
                read(*rs, "enabled", out.relative_strength.enabled);
                read(*rs, "field", out.relative_strength.field);
                read(*rs, "threshold", out.relative_strength.threshold);
            }
            if (const json* d = section(stages, "daily")) {
                read(*d, "enabled", out.daily.enabled);
                if (d->contains("windows")) {
                    out.daily.windows = readWindows(d->at("windows"));
                }
                read(*d, "stop_loss_fraction", out.daily.stop_loss_fraction);
                read(*d, "min_long_ma_momentum", out.daily.min_long_ma_momentum);
                read(*d, "short_ma_field", out.daily.short_ma_field);
                read(*d, "long_ma_field", out.daily.long_ma_field);
                read(*d, "momentum_field", out.daily.momentum_field);
                read(*d, "alternate_rs_enabled", out.daily.alternate_rs_enabled);
                read(*d, "alternate_rs_field", out.daily.alternate_rs_field);
                read(*d, "alternate_window_label", out.daily.alternate_window_label);
            }
        }

        void readExecution(const json& x, ExecutionConfig& out) {
            read(x, "initial_cash", out.initial_cash);
            read(x, "max_positions", out.max_positions);
            read(x, "max_position_fraction", out.max_position_fraction);
            read(x, "cash_reserve_fraction", out.cash_reserve_fraction);
            read(x, "risk_per_trade", out.risk_per_trade);
            read(x, "base_allocation", out.base_allocation);
            read(x, "adr_high_threshold", out.adr_high_threshold);
            read(x, "adr_high_scale", out.adr_high_scale);
            read(x, "adr_low_threshold", out.adr_low_threshold);
            read(x, "adr_low_scale", out.adr_low_scale);
            read(x, "default_stop_fraction", out.default_stop_fraction);
            read(x, "slippage", out.slippage);
            read(x, "commission_rate", out.commission_rate);
            read(x, "partial_exit_enabled", out.partial_exit_enabled);
            read(x, "partial_exit_gain", out.partial_exit_gain);
            read(x, "partial_exit_fraction", out.partial_exit_fraction);
            read(x, "partial_exit_risk_multiplier", out.partial_exit_risk_multiplier);
            read(x, "pyramiding_enabled", out.pyramiding_enabled);
            read(x, "max_pyramid_levels", out.max_pyramid_levels);
            read(x, "pyramid_fraction", out.pyramid_fraction);
            read(x, "trailing_stop_enabled", out.trailing_stop_enabled);
            read(x, "trailing_step", out.trailing_step);
            read(x, "same_step_stop", out.same_step_stop);
            read(x, "exit_signal_enabled", out.exit_signal_enabled);
            read(x, "exit_signal_field", out.exit_signal_field);
            read(x, "close_positions_at_end", out.close_positions_at_end);
        }

    } // end anonymous namespace

    Profile ProfileLoader::fromJson(const json& config) {
        if (!config.is_object()) {
            throw core::ConfigException("Profile config must be a JSON object.");
        }

        Profile profile;
        try {
            read(config, "name", profile.name);
            if (config.contains("mode")) {
                std::string mode_str;
                read(config, "mode", mode_str);
                profile.mode = core::utils::modeFromString(mode_str);
            }
            if (config.contains("resolution")) {
                std::string resolution_str;
                read(config, "resolution", resolution_str);
                profile.resolution = core::utils::resolutionFromString(resolution_str);
            }
            read(config, "worker_threads", profile.worker_threads);
            read(config, "risk_free_rate", profile.risk_free_rate);

            if (const json* stages = section(config, "stages")) {
                readStages(*stages, profile.stages);
            }
            if (const json* execution = section(config, "execution")) {
                readExecution(*execution, profile.execution);
            }
        } catch (const json::exception& e) {
            throw core::ConfigException(fmt::format("Invalid JSON structure in profile: {}", e.what()));
        }

        validate(profile);

        if (core::logging::isInitialized()) {
            core::logging::getLogger()->info("Loaded profile '{}' (mode: {}, resolution: {})",
                                             profile.name,
                                             core::utils::toString(profile.mode),
                                             core::utils::toString(profile.resolution));
        }
        return profile;
    }

    Profile ProfileLoader::fromFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw core::ConfigException("Cannot open profile file: " + path);
        }
        json config;
        try {
            file >> config;
        } catch (const json::parse_error& e) {
            throw core::ConfigException(fmt::format("Profile file '{}' is not valid JSON: {}", path, e.what()));
        }
        return fromJson(config);
    }

    json ProfileLoader::toJson(const Profile& profile) {
        const auto& s = profile.stages;
        const auto& x = profile.execution;

        json windows = json::array();
        for (const auto& window : s.daily.windows) {
            windows.push_back({{"label", window.label}, {"bars", window.bars}});
        }

        return json{
            {"name", profile.name},
            {"mode", core::utils::toString(profile.mode)},
            {"resolution", core::utils::toString(profile.resolution)},
            {"worker_threads", profile.worker_threads},
            {"risk_free_rate", profile.risk_free_rate},
            {"stages", {
                {"earnings", {
                    {"enabled", s.earnings.enabled},
                    {"growth_floor", s.earnings.growth_floor},
                    {"min_records", s.earnings.min_records}}},
                {"fundamental", {
                    {"enabled", s.fundamental.enabled},
                    {"min_market_cap", s.fundamental.min_market_cap},
                    {"max_market_cap", s.fundamental.max_market_cap},
                    {"growth_threshold", s.fundamental.growth_threshold},
                    {"prior_growth_floor", s.fundamental.prior_growth_floor}}},
                {"weekly", {
                    {"enabled", s.weekly.enabled},
                    {"stability_tolerance", s.weekly.stability_tolerance},
                    {"low_distance_factor", s.weekly.low_distance_factor},
                    {"high_distance_factor", s.weekly.high_distance_factor}}},
                {"relative_strength", {
                    {"enabled", s.relative_strength.enabled},
                    {"field", s.relative_strength.field},
                    {"threshold", s.relative_strength.threshold}}},
                {"daily", {
                    {"enabled", s.daily.enabled},
                    {"windows", windows},
                    {"stop_loss_fraction", s.daily.stop_loss_fraction},
                    {"min_long_ma_momentum", s.daily.min_long_ma_momentum},
                    {"short_ma_field", s.daily.short_ma_field},
                    {"long_ma_field", s.daily.long_ma_field},
                    {"momentum_field", s.daily.momentum_field},
                    {"alternate_rs_enabled", s.daily.alternate_rs_enabled},
                    {"alternate_rs_field", s.daily.alternate_rs_field},
                    {"alternate_window_label", s.daily.alternate_window_label}}}
            }},
            {"execution", {
                {"initial_cash", x.initial_cash},
                {"max_positions", x.max_positions},
                {"max_position_fraction", x.max_position_fraction},
                {"cash_reserve_fraction", x.cash_reserve_fraction},
                {"risk_per_trade", x.risk_per_trade},
                {"base_allocation", x.base_allocation},
                {"adr_high_threshold", x.adr_high_threshold},
                {"adr_high_scale", x.adr_high_scale},
                {"adr_low_threshold", x.adr_low_threshold},
                {"adr_low_scale", x.adr_low_scale},
                {"default_stop_fraction", x.default_stop_fraction},
                {"slippage", x.slippage},
                {"commission_rate", x.commission_rate},
                {"partial_exit_enabled", x.partial_exit_enabled},
                {"partial_exit_gain", x.partial_exit_gain},
                {"partial_exit_fraction", x.partial_exit_fraction},
                {"partial_exit_risk_multiplier", x.partial_exit_risk_multiplier},
                {"pyramiding_enabled", x.pyramiding_enabled},
                {"max_pyramid_levels", x.max_pyramid_levels},
                {"pyramid_fraction", x.pyramid_fraction},
                {"trailing_stop_enabled", x.trailing_stop_enabled},
                {"trailing_step", x.trailing_step},
                {"same_step_stop", x.same_step_stop},
                {"exit_signal_enabled", x.exit_signal_enabled},
                {"exit_signal_field", x.exit_signal_field},
                {"close_positions_at_end", x.close_positions_at_end}
            }}
        };
    }

} // namespace config
