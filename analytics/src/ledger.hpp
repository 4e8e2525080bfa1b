#pragma once

#include "types.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Read side of the resolved-outcome ledger
class OutcomeLedger {
public:
    virtual ~OutcomeLedger() = default;

    // Consistent view of every resolved outcome plus open idea counts.
    // Throws RecomputeError(LedgerUnavailable) when the backing store cannot be read.
    virtual LedgerSnapshot load_snapshot() = 0;
};

// Ledger held in memory; used by tests and event replay
class InMemoryLedger : public OutcomeLedger {
public:
    using WriteListener = std::function<void(const TradeOutcome&)>;

    explicit InMemoryLedger(double breakeven_band_pct);

    // Rejects a row whose resolution disagrees with its return (ValidationError)
    void append(const TradeOutcome& outcome);
    void add_open_idea(const std::string& symbol, int count = 1);

    void set_write_listener(WriteListener listener);

    LedgerSnapshot load_snapshot() override;

    size_t size() const;

private:
    double breakeven_band_pct_;
    mutable std::mutex mutex_;
    std::vector<TradeOutcome> outcomes_;
    std::map<std::string, int> open_ideas_;
    uint64_t generation_ = 0;
    WriteListener listener_;
};
