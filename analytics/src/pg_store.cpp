#include "pg_store.hpp"
#include "pipeline.hpp"
#include "catalyst.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <optional>

namespace {

std::chrono::system_clock::time_point from_epoch_ms(long long ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS engine_metrics (
    grouping TEXT NOT NULL,
    key TEXT NOT NULL,
    trade_count INTEGER NOT NULL,
    win_count INTEGER NOT NULL,
    loss_count INTEGER NOT NULL,
    breakeven_count INTEGER NOT NULL,
    win_rate DOUBLE PRECISION NOT NULL,
    expectancy DOUBLE PRECISION NOT NULL,
    sharpe_ratio DOUBLE PRECISION,
    profit_factor DOUBLE PRECISION,
    max_drawdown DOUBLE PRECISION NOT NULL,
    avg_win_pct DOUBLE PRECISION,
    avg_loss_pct DOUBLE PRECISION,
    avg_confidence DOUBLE PRECISION NOT NULL,
    version BIGINT NOT NULL,
    computed_at TIMESTAMPTZ NOT NULL,
    PRIMARY KEY (grouping, key)
);
CREATE TABLE IF NOT EXISTS calibration_bins (
    bin_start DOUBLE PRECISION PRIMARY KEY,
    bin_end DOUBLE PRECISION NOT NULL,
    predicted_confidence DOUBLE PRECISION,
    actual_win_rate DOUBLE PRECISION,
    sample_size INTEGER NOT NULL,
    win_count INTEGER NOT NULL,
    standard_error DOUBLE PRECISION NOT NULL,
    is_calibrated BOOLEAN NOT NULL,
    version BIGINT NOT NULL,
    computed_at TIMESTAMPTZ NOT NULL
);
CREATE TABLE IF NOT EXISTS signal_weights (
    signal_name TEXT PRIMARY KEY,
    base_weight DOUBLE PRECISION NOT NULL,
    dynamic_weight DOUBLE PRECISION NOT NULL,
    effective_weight DOUBLE PRECISION NOT NULL,
    win_rate DOUBLE PRECISION,
    expectancy DOUBLE PRECISION,
    trade_count INTEGER NOT NULL,
    tier TEXT NOT NULL,
    is_overridden BOOLEAN NOT NULL,
    override_weight DOUBLE PRECISION,
    version BIGINT NOT NULL,
    computed_at TIMESTAMPTZ NOT NULL
);
CREATE TABLE IF NOT EXISTS symbol_profiles (
    symbol TEXT PRIMARY KEY,
    total_ideas INTEGER NOT NULL,
    closed_ideas INTEGER NOT NULL,
    wins INTEGER NOT NULL,
    losses INTEGER NOT NULL,
    breakevens INTEGER NOT NULL,
    overall_win_rate DOUBLE PRECISION,
    long_win_rate DOUBLE PRECISION,
    short_win_rate DOUBLE PRECISION,
    total_pnl DOUBLE PRECISION,
    profit_factor DOUBLE PRECISION,
    avg_win_pct DOUBLE PRECISION,
    avg_loss_pct DOUBLE PRECISION,
    best_catalyst TEXT,
    best_catalyst_win_rate DOUBLE PRECISION,
    worst_catalyst TEXT,
    worst_catalyst_win_rate DOUBLE PRECISION,
    avg_confidence DOUBLE PRECISION,
    confidence_realization DOUBLE PRECISION,
    last_trade_at TIMESTAMPTZ,
    version BIGINT NOT NULL,
    computed_at TIMESTAMPTZ NOT NULL
);
CREATE TABLE IF NOT EXISTS confidence_calibration (
    band TEXT PRIMARY KEY,
    band_min DOUBLE PRECISION NOT NULL,
    band_max DOUBLE PRECISION NOT NULL,
    ideas INTEGER NOT NULL,
    wins INTEGER NOT NULL,
    expected_win_rate DOUBLE PRECISION NOT NULL,
    actual_win_rate DOUBLE PRECISION,
    calibration_error DOUBLE PRECISION,
    version BIGINT NOT NULL,
    computed_at TIMESTAMPTZ NOT NULL
);
CREATE TABLE IF NOT EXISTS signal_weight_overrides (
    signal_name TEXT PRIMARY KEY,
    weight DOUBLE PRECISION NOT NULL CHECK (weight > 0),
    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
);
)SQL";

std::optional<std::string> optional_iso(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) return std::nullopt;
    return util::format_iso8601(*tp);
}

} // namespace

class PostgresStore::Impl {
public:
    Impl(const Config& config)
        : config_(config), backoff_ms_(1000), retry_count_(0) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (!connect_locked()) {
            spdlog::warn("PostgreSQL unavailable at startup; reads will retry with backoff");
        }
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (conn_ && conn_->is_open()) {
            conn_->close();
            conn_.reset();
            spdlog::info("Disconnected from PostgreSQL database");
        }
    }

    bool is_connected() const {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        return conn_ && conn_->is_open();
    }

    bool ensure_schema() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (!ensure_connection_locked()) {
            return false;
        }
        try {
            pqxx::work txn(*conn_);
            txn.exec(kSchema);
            txn.commit();
            spdlog::info("Derived table schema verified");
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to create derived tables: {}", e.what());
            return false;
        }
    }

    LedgerSnapshot load_snapshot() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (!ensure_connection_locked()) {
            throw RecomputeError(RecomputeErrorKind::LedgerUnavailable, "PostgreSQL is not connected");
        }

        try {
            pqxx::work txn(*conn_);
            LedgerSnapshot snapshot;

            pqxx::result rows = txn.exec_params(
                "SELECT id, symbol, engine, asset_type, direction, "
                "array_to_string(signals, ',') AS signals, confidence, catalyst, return_pct, "
                "(EXTRACT(EPOCH FROM opened_at) * 1000)::BIGINT AS opened_ms, "
                "(EXTRACT(EPOCH FROM closed_at) * 1000)::BIGINT AS closed_ms "
                "FROM trade_outcomes "
                "WHERE closed_at IS NOT NULL AND return_pct IS NOT NULL "
                "AND ($1::INT <= 0 OR closed_at >= NOW() - make_interval(days => $1::INT)) "
                "ORDER BY closed_at, id",
                config_.lookback_days
            );

            int malformed = 0;
            for (const auto& row : rows) {
                auto outcome = parse_row(row);
                if (outcome) {
                    snapshot.outcomes.push_back(std::move(*outcome));
                } else {
                    malformed++;
                }
            }

            pqxx::result open_rows = txn.exec(
                "SELECT symbol, COUNT(*) AS open_count "
                "FROM trade_outcomes "
                "WHERE closed_at IS NULL "
                "GROUP BY symbol"
            );
            for (const auto& row : open_rows) {
                snapshot.open_ideas[row["symbol"].as<std::string>()] = row["open_count"].as<int>();
            }

            txn.commit();

            if (malformed > 0) {
                spdlog::warn("Skipped {} malformed trade_outcomes rows", malformed);
            }
            spdlog::info("Loaded {} resolved outcomes and {} symbols with open ideas",
                         snapshot.outcomes.size(), snapshot.open_ideas.size());
            return snapshot;
        } catch (const std::exception& e) {
            spdlog::error("Error loading trade outcomes: {}", e.what());
            throw RecomputeError(RecomputeErrorKind::LedgerUnavailable, e.what());
        }
    }

    void persist_snapshot(const DerivedSnapshot& snapshot) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (!ensure_connection_locked()) {
            throw std::runtime_error("PostgreSQL is not connected");
        }

        const auto version = static_cast<long long>(snapshot.version);
        const std::string computed_at = util::format_iso8601(snapshot.computed_at);

        pqxx::work txn(*conn_);

        auto write_metrics = [&](const std::string& grouping, const std::vector<EngineMetrics>& metrics) {
            for (const auto& m : metrics) {
                txn.exec_params(
                    "INSERT INTO engine_metrics (grouping, key, trade_count, win_count, loss_count, "
                    "breakeven_count, win_rate, expectancy, sharpe_ratio, profit_factor, max_drawdown, "
                    "avg_win_pct, avg_loss_pct, avg_confidence, version, computed_at) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16) "
                    "ON CONFLICT (grouping, key) DO UPDATE SET "
                    "trade_count = EXCLUDED.trade_count, win_count = EXCLUDED.win_count, "
                    "loss_count = EXCLUDED.loss_count, breakeven_count = EXCLUDED.breakeven_count, "
                    "win_rate = EXCLUDED.win_rate, expectancy = EXCLUDED.expectancy, "
                    "sharpe_ratio = EXCLUDED.sharpe_ratio, profit_factor = EXCLUDED.profit_factor, "
                    "max_drawdown = EXCLUDED.max_drawdown, avg_win_pct = EXCLUDED.avg_win_pct, "
                    "avg_loss_pct = EXCLUDED.avg_loss_pct, avg_confidence = EXCLUDED.avg_confidence, "
                    "version = EXCLUDED.version, computed_at = EXCLUDED.computed_at",
                    grouping, m.key, m.trade_count, m.win_count, m.loss_count, m.breakeven_count,
                    m.win_rate, m.expectancy, m.sharpe_ratio, m.profit_factor, m.max_drawdown,
                    m.avg_win_pct, m.avg_loss_pct, m.avg_confidence, version, computed_at
                );
            }
        };

        write_metrics("engine", snapshot.engine_metrics);
        write_metrics("symbol", snapshot.symbol_metrics);
        write_metrics("direction", snapshot.direction_metrics);
        write_metrics("catalyst", snapshot.catalyst_metrics);
        write_metrics("asset_type", snapshot.asset_type_metrics);
        write_metrics("signal", snapshot.signal_stats);

        for (const auto& bin : snapshot.calibration.bins) {
            txn.exec_params(
                "INSERT INTO calibration_bins (bin_start, bin_end, predicted_confidence, actual_win_rate, "
                "sample_size, win_count, standard_error, is_calibrated, version, computed_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10) "
                "ON CONFLICT (bin_start) DO UPDATE SET "
                "bin_end = EXCLUDED.bin_end, predicted_confidence = EXCLUDED.predicted_confidence, "
                "actual_win_rate = EXCLUDED.actual_win_rate, sample_size = EXCLUDED.sample_size, "
                "win_count = EXCLUDED.win_count, standard_error = EXCLUDED.standard_error, "
                "is_calibrated = EXCLUDED.is_calibrated, version = EXCLUDED.version, "
                "computed_at = EXCLUDED.computed_at",
                bin.bin_start, bin.bin_end, bin.predicted_confidence, bin.actual_win_rate,
                bin.sample_size, bin.win_count, bin.standard_error, bin.is_calibrated, version, computed_at
            );
        }

        for (const auto& w : snapshot.signal_weights) {
            txn.exec_params(
                "INSERT INTO signal_weights (signal_name, base_weight, dynamic_weight, effective_weight, "
                "win_rate, expectancy, trade_count, tier, is_overridden, override_weight, version, computed_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12) "
                "ON CONFLICT (signal_name) DO UPDATE SET "
                "base_weight = EXCLUDED.base_weight, dynamic_weight = EXCLUDED.dynamic_weight, "
                "effective_weight = EXCLUDED.effective_weight, win_rate = EXCLUDED.win_rate, "
                "expectancy = EXCLUDED.expectancy, trade_count = EXCLUDED.trade_count, "
                "tier = EXCLUDED.tier, is_overridden = EXCLUDED.is_overridden, "
                "override_weight = EXCLUDED.override_weight, version = EXCLUDED.version, "
                "computed_at = EXCLUDED.computed_at",
                w.signal_name, w.base_weight, w.dynamic_weight(), w.effective_weight(), w.win_rate,
                w.expectancy, w.trade_count, to_string(w.tier), w.is_overridden(), w.override_weight(),
                version, computed_at
            );
        }

        for (const auto& [symbol, p] : snapshot.historical.profiles) {
            txn.exec_params(
                "INSERT INTO symbol_profiles (symbol, total_ideas, closed_ideas, wins, losses, breakevens, "
                "overall_win_rate, long_win_rate, short_win_rate, total_pnl, profit_factor, avg_win_pct, "
                "avg_loss_pct, best_catalyst, best_catalyst_win_rate, worst_catalyst, worst_catalyst_win_rate, "
                "avg_confidence, confidence_realization, last_trade_at, version, computed_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, $17, "
                "$18, $19, $20, $21, $22) "
                "ON CONFLICT (symbol) DO UPDATE SET "
                "total_ideas = EXCLUDED.total_ideas, closed_ideas = EXCLUDED.closed_ideas, "
                "wins = EXCLUDED.wins, losses = EXCLUDED.losses, breakevens = EXCLUDED.breakevens, "
                "overall_win_rate = EXCLUDED.overall_win_rate, long_win_rate = EXCLUDED.long_win_rate, "
                "short_win_rate = EXCLUDED.short_win_rate, total_pnl = EXCLUDED.total_pnl, "
                "profit_factor = EXCLUDED.profit_factor, avg_win_pct = EXCLUDED.avg_win_pct, "
                "avg_loss_pct = EXCLUDED.avg_loss_pct, best_catalyst = EXCLUDED.best_catalyst, "
                "best_catalyst_win_rate = EXCLUDED.best_catalyst_win_rate, "
                "worst_catalyst = EXCLUDED.worst_catalyst, "
                "worst_catalyst_win_rate = EXCLUDED.worst_catalyst_win_rate, "
                "avg_confidence = EXCLUDED.avg_confidence, "
                "confidence_realization = EXCLUDED.confidence_realization, "
                "last_trade_at = EXCLUDED.last_trade_at, version = EXCLUDED.version, "
                "computed_at = EXCLUDED.computed_at",
                symbol, p.total_ideas, p.closed_ideas, p.wins, p.losses, p.breakevens,
                p.overall_win_rate, p.long_win_rate, p.short_win_rate, p.total_pnl, p.profit_factor,
                p.avg_win_pct, p.avg_loss_pct, p.best_catalyst, p.best_catalyst_win_rate,
                p.worst_catalyst, p.worst_catalyst_win_rate, p.avg_confidence, p.confidence_realization,
                optional_iso(p.last_trade_at), version, computed_at
            );
        }

        for (const auto& band : snapshot.historical.stats.by_confidence_band) {
            txn.exec_params(
                "INSERT INTO confidence_calibration (band, band_min, band_max, ideas, wins, "
                "expected_win_rate, actual_win_rate, calibration_error, version, computed_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10) "
                "ON CONFLICT (band) DO UPDATE SET "
                "band_min = EXCLUDED.band_min, band_max = EXCLUDED.band_max, ideas = EXCLUDED.ideas, "
                "wins = EXCLUDED.wins, expected_win_rate = EXCLUDED.expected_win_rate, "
                "actual_win_rate = EXCLUDED.actual_win_rate, "
                "calibration_error = EXCLUDED.calibration_error, version = EXCLUDED.version, "
                "computed_at = EXCLUDED.computed_at",
                band.band, band.band_min, band.band_max, band.ideas, band.wins, band.expected_win_rate,
                band.actual_win_rate, band.calibration_error, version, computed_at
            );
        }

        // Rows not touched by this version belong to groups that no longer exist
        for (const char* table : {"engine_metrics", "calibration_bins", "signal_weights",
                                  "symbol_profiles", "confidence_calibration"}) {
            txn.exec_params(std::string("DELETE FROM ") + table + " WHERE version <> $1", version);
        }

        txn.commit();
        spdlog::info("Persisted derived tables for version {}", version);
    }

    std::map<std::string, double> load_overrides() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        std::map<std::string, double> overrides;
        if (!ensure_connection_locked()) {
            return overrides;
        }

        try {
            pqxx::work txn(*conn_);
            pqxx::result result = txn.exec("SELECT signal_name, weight FROM signal_weight_overrides");
            for (const auto& row : result) {
                overrides[row["signal_name"].as<std::string>()] = row["weight"].as<double>();
            }
            txn.commit();
            spdlog::info("Loaded {} signal weight overrides", overrides.size());
        } catch (const std::exception& e) {
            spdlog::error("Error loading signal weight overrides: {}", e.what());
        }
        return overrides;
    }

    bool save_override(const std::string& signal_name, double weight) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (!ensure_connection_locked()) {
            return false;
        }

        try {
            pqxx::work txn(*conn_);
            txn.exec_params(
                "INSERT INTO signal_weight_overrides (signal_name, weight, updated_at) "
                "VALUES ($1, $2, NOW()) "
                "ON CONFLICT (signal_name) DO UPDATE SET weight = EXCLUDED.weight, updated_at = NOW()",
                signal_name, weight
            );
            txn.commit();
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Error saving override for {}: {}", signal_name, e.what());
            return false;
        }
    }

    bool delete_override(const std::string& signal_name) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (!ensure_connection_locked()) {
            return false;
        }

        try {
            pqxx::work txn(*conn_);
            txn.exec_params("DELETE FROM signal_weight_overrides WHERE signal_name = $1", signal_name);
            txn.commit();
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Error deleting override for {}: {}", signal_name, e.what());
            return false;
        }
    }

private:
    bool connect_locked() {
        try {
            conn_ = std::make_unique<pqxx::connection>(config_.pg_dsn);
            if (conn_->is_open()) {
                spdlog::info("Connected to PostgreSQL database");
                backoff_ms_ = 1000;
                retry_count_ = 0;
                return true;
            }
            spdlog::error("PostgreSQL connection is not open");
            return false;
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to PostgreSQL: {}", e.what());
            return false;
        }
    }

    bool ensure_connection_locked() {
        if (conn_ && conn_->is_open()) {
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::milliseconds>(
                now - last_connection_attempt_).count() < backoff_ms_) {
            return false;
        }
        last_connection_attempt_ = now;

        if (connect_locked()) {
            spdlog::info("PostgreSQL connection restored");
            return true;
        }

        spdlog::warn("PostgreSQL reconnection failed (attempt {}), next retry in {} ms",
                     ++retry_count_, backoff_ms_ * 2 > 30000 ? 30000 : backoff_ms_ * 2);
        backoff_ms_ = std::min(backoff_ms_ * 2, 30000);
        return false;
    }

    std::optional<TradeOutcome> parse_row(const pqxx::row& row) const {
        try {
            TradeOutcome outcome;
            outcome.id = row["id"].as<std::string>();
            outcome.symbol = row["symbol"].as<std::string>();
            outcome.engine = row["engine"].is_null() ? "unknown" : row["engine"].as<std::string>();
            if (!row["asset_type"].is_null()) {
                outcome.asset_type = row["asset_type"].as<std::string>();
            }

            auto direction = direction_from_string(row["direction"].as<std::string>());
            if (!direction) {
                spdlog::debug("Skipping outcome {}: unknown direction", outcome.id);
                return std::nullopt;
            }
            outcome.direction = *direction;

            if (!row["signals"].is_null()) {
                outcome.signals = util::split_string(row["signals"].as<std::string>(), ',');
            }
            if (row["confidence"].is_null()) {
                spdlog::debug("Skipping outcome {}: no confidence", outcome.id);
                return std::nullopt;
            }
            outcome.confidence = row["confidence"].as<double>();
            if (!row["catalyst"].is_null()) {
                outcome.catalyst = categorize_catalyst(row["catalyst"].as<std::string>());
            }

            // Resolution is derived from the return so it always agrees with the band
            outcome.return_pct = row["return_pct"].as<double>();
            outcome.resolution = classify_return(outcome.return_pct, config_.breakeven_band_pct);

            outcome.opened_at = row["opened_ms"].is_null()
                ? from_epoch_ms(row["closed_ms"].as<long long>())
                : from_epoch_ms(row["opened_ms"].as<long long>());
            outcome.closed_at = from_epoch_ms(row["closed_ms"].as<long long>());
            return outcome;
        } catch (const std::exception& e) {
            spdlog::debug("Skipping malformed outcome row: {}", e.what());
            return std::nullopt;
        }
    }

    const Config& config_;
    mutable std::mutex conn_mutex_;
    std::unique_ptr<pqxx::connection> conn_;

    // Reconnection logic
    std::chrono::steady_clock::time_point last_connection_attempt_ = std::chrono::steady_clock::now();
    int backoff_ms_;
    int retry_count_;
};

PostgresStore::PostgresStore(const Config& config) : impl_(std::make_unique<Impl>(config)) {}

PostgresStore::~PostgresStore() = default;

bool PostgresStore::is_connected() const {
    return impl_->is_connected();
}

bool PostgresStore::ensure_schema() {
    return impl_->ensure_schema();
}

LedgerSnapshot PostgresStore::load_snapshot() {
    return impl_->load_snapshot();
}

void PostgresStore::persist_snapshot(const DerivedSnapshot& snapshot) {
    impl_->persist_snapshot(snapshot);
}

std::map<std::string, double> PostgresStore::load_overrides() {
    return impl_->load_overrides();
}

bool PostgresStore::save_override(const std::string& signal_name, double weight) {
    return impl_->save_override(signal_name, weight);
}

bool PostgresStore::delete_override(const std::string& signal_name) {
    return impl_->delete_override(signal_name);
}
