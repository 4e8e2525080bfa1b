#pragma once

#include "types.hpp"
#include "config.hpp"
#include "ledger.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace test_helpers {

// 2024-01-01T00:00:00Z
inline std::chrono::system_clock::time_point base_time() {
    return std::chrono::system_clock::time_point(std::chrono::seconds(1704067200));
}

inline std::chrono::system_clock::time_point day(int n) {
    return base_time() + std::chrono::hours(24 * n);
}

// Fluent builder; resolution always follows the return and the default 0.5 band
class OutcomeBuilder {
public:
    explicit OutcomeBuilder(const std::string& id) {
        outcome_.id = id;
        outcome_.symbol = "AAPL";
        outcome_.engine = "ai";
        outcome_.confidence = 60.0;
        outcome_.opened_at = day(0);
        outcome_.closed_at = day(1);
        ret(1.0);
    }

    OutcomeBuilder& symbol(const std::string& s) { outcome_.symbol = s; return *this; }
    OutcomeBuilder& engine(const std::string& e) { outcome_.engine = e; return *this; }
    OutcomeBuilder& asset(const std::string& a) { outcome_.asset_type = a; return *this; }
    OutcomeBuilder& dir(Direction d) { outcome_.direction = d; return *this; }
    OutcomeBuilder& signals(std::vector<std::string> s) { outcome_.signals = std::move(s); return *this; }
    OutcomeBuilder& confidence(double c) { outcome_.confidence = c; return *this; }
    OutcomeBuilder& catalyst(const std::string& c) { outcome_.catalyst = c; return *this; }
    OutcomeBuilder& closed(int n) {
        outcome_.opened_at = day(n - 1);
        outcome_.closed_at = day(n);
        return *this;
    }
    OutcomeBuilder& ret(double r, double band = 0.5) {
        outcome_.return_pct = r;
        outcome_.resolution = classify_return(r, band);
        return *this;
    }

    TradeOutcome build() const { return outcome_; }

private:
    TradeOutcome outcome_;
};

inline OutcomeBuilder outcome(const std::string& id) {
    return OutcomeBuilder(id);
}

// n wins at +win_ret followed by m losses at loss_ret, one per day from first_day
inline std::vector<TradeOutcome> series(const std::string& prefix, int wins, int losses,
                                        double win_ret = 2.0, double loss_ret = -1.0,
                                        int first_day = 1) {
    std::vector<TradeOutcome> rows;
    int d = first_day;
    for (int i = 0; i < wins; ++i) {
        rows.push_back(outcome(prefix + "-w" + std::to_string(i)).ret(win_ret).closed(d++).build());
    }
    for (int i = 0; i < losses; ++i) {
        rows.push_back(outcome(prefix + "-l" + std::to_string(i)).ret(loss_ret).closed(d++).build());
    }
    return rows;
}

// Ledger that fails every read
class UnavailableLedger : public OutcomeLedger {
public:
    LedgerSnapshot load_snapshot() override {
        throw std::runtime_error("connection refused");
    }
};

} // namespace test_helpers
