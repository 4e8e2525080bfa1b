#include "ledger.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

InMemoryLedger::InMemoryLedger(double breakeven_band_pct)
    : breakeven_band_pct_(breakeven_band_pct) {}

void InMemoryLedger::append(const TradeOutcome& outcome) {
    Resolution expected = classify_return(outcome.return_pct, breakeven_band_pct_);
    if (expected != outcome.resolution) {
        throw ValidationError(fmt::format(
            "Outcome {} resolved as {} but return {:.4f}% classifies as {}",
            outcome.id, to_string(outcome.resolution), outcome.return_pct, to_string(expected)));
    }

    WriteListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_.push_back(outcome);

        auto it = open_ideas_.find(outcome.symbol);
        if (it != open_ideas_.end() && it->second > 0) {
            it->second--;
        }
        generation_++;
        listener = listener_;
    }

    spdlog::debug("Ledger append {} ({} {})", outcome.id, outcome.symbol, to_string(outcome.resolution));
    if (listener) {
        listener(outcome);
    }
}

void InMemoryLedger::add_open_idea(const std::string& symbol, int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ideas_[symbol] += count;
    generation_++;
}

void InMemoryLedger::set_write_listener(WriteListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

LedgerSnapshot InMemoryLedger::load_snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerSnapshot snapshot;
    snapshot.outcomes = outcomes_;
    snapshot.open_ideas = open_ideas_;
    snapshot.generation = generation_;
    return snapshot;
}

size_t InMemoryLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_.size();
}
