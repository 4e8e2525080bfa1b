#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <cmath>

using util::get_env_var;
using util::get_env_int;
using util::get_env_double;
using util::get_env_bool;

void Config::load_from_env() {
    // Redis configuration
    redis_url = get_env_var("REDIS_URL", redis_url);
    stream_ledger_events = get_env_var("STREAM_LEDGER_EVENTS", stream_ledger_events);
    stream_req = get_env_var("STREAM_REQ", stream_req);
    stream_rep = get_env_var("STREAM_REP", stream_rep);
    stream_refreshed = get_env_var("STREAM_REFRESHED", stream_refreshed);
    redis_enabled = get_env_bool("REDIS_ENABLED", redis_enabled);

    // PostgreSQL configuration
    pg_dsn = get_env_var("PG_DSN", pg_dsn);
    persist_derived_tables = get_env_bool("PERSIST_DERIVED_TABLES", persist_derived_tables);
    lookback_days = get_env_int("LOOKBACK_DAYS", lookback_days);

    // Service configuration
    service_name = get_env_var("SERVICE_NAME", service_name);
    listen_addr = get_env_var("LISTEN_ADDR", listen_addr);
    listen_port = get_env_int("LISTEN_PORT", listen_port);
    log_level = get_env_var("LOG_LEVEL", log_level);

    refresh_interval_min = get_env_int("REFRESH_INTERVAL_MIN", refresh_interval_min);
    refresh_on_start = get_env_bool("REFRESH_ON_START", refresh_on_start);

    breakeven_band_pct = get_env_double("BREAKEVEN_BAND_PCT", breakeven_band_pct);

    health_min_trades = get_env_int("HEALTH_MIN_TRADES", health_min_trades);
    health_min_profit_factor = get_env_double("HEALTH_MIN_PROFIT_FACTOR", health_min_profit_factor);
    health_warn_win_rate = get_env_double("HEALTH_WARN_WIN_RATE", health_warn_win_rate);

    calibration_bin_width = get_env_double("CALIBRATION_BIN_WIDTH", calibration_bin_width);
    calibration_tolerance = get_env_double("CALIBRATION_TOLERANCE", calibration_tolerance);
    calibration_min_bin_samples = get_env_int("CALIBRATION_MIN_BIN_SAMPLES", calibration_min_bin_samples);

    tier_low_min_trades = get_env_int("TIER_LOW_MIN_TRADES", tier_low_min_trades);
    tier_medium_min_trades = get_env_int("TIER_MEDIUM_MIN_TRADES", tier_medium_min_trades);
    tier_high_min_trades = get_env_int("TIER_HIGH_MIN_TRADES", tier_high_min_trades);
    baseline_win_rate = get_env_double("BASELINE_WIN_RATE", baseline_win_rate);
    min_signal_weight = get_env_double("MIN_SIGNAL_WEIGHT", min_signal_weight);
    max_signal_weight = get_env_double("MAX_SIGNAL_WEIGHT", max_signal_weight);
    weight_shrinkage_trades = get_env_double("WEIGHT_SHRINKAGE_TRADES", weight_shrinkage_trades);
    weight_neutral_epsilon = get_env_double("WEIGHT_NEUTRAL_EPSILON", weight_neutral_epsilon);
    top_signals_limit = get_env_int("TOP_SIGNALS_LIMIT", top_signals_limit);
    dynamic_weights_enabled = get_env_bool("DYNAMIC_WEIGHTS_ENABLED", dynamic_weights_enabled);

    catalyst_min_samples = get_env_int("CATALYST_MIN_SAMPLES", catalyst_min_samples);
    performer_min_trades = get_env_int("PERFORMER_MIN_TRADES", performer_min_trades);
    performers_limit = get_env_int("PERFORMERS_LIMIT", performers_limit);
    recent_trades_limit = get_env_int("RECENT_TRADES_LIMIT", recent_trades_limit);
    adjustment_min_closed = get_env_int("ADJUSTMENT_MIN_CLOSED", adjustment_min_closed);
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }

    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be between 1 and 65535");
    }

    if (refresh_interval_min <= 0) {
        throw std::runtime_error("REFRESH_INTERVAL_MIN must be positive");
    }

    if (breakeven_band_pct < 0.0 || !std::isfinite(breakeven_band_pct)) {
        throw std::runtime_error("BREAKEVEN_BAND_PCT must be a non-negative number");
    }

    if (calibration_bin_width <= 0.0 || calibration_bin_width > 100.0) {
        throw std::runtime_error("CALIBRATION_BIN_WIDTH must be in (0, 100]");
    }

    if (calibration_tolerance < 0.0) {
        throw std::runtime_error("CALIBRATION_TOLERANCE cannot be negative");
    }

    if (!(tier_low_min_trades > 0 &&
          tier_low_min_trades < tier_medium_min_trades &&
          tier_medium_min_trades < tier_high_min_trades)) {
        throw std::runtime_error("Tier thresholds must satisfy 0 < low < medium < high");
    }

    if (baseline_win_rate <= 0.0 || baseline_win_rate > 100.0) {
        throw std::runtime_error("BASELINE_WIN_RATE must be in (0, 100]");
    }

    if (min_signal_weight <= 0.0 || min_signal_weight > 1.0 || max_signal_weight < 1.0) {
        throw std::runtime_error("Signal weight clamp must satisfy 0 < min <= 1 <= max");
    }

    if (weight_shrinkage_trades < 0.0) {
        throw std::runtime_error("WEIGHT_SHRINKAGE_TRADES cannot be negative");
    }

    spdlog::info("Configuration validated successfully");
}
