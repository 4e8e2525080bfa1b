#pragma once

#include "config.hpp"
#include "types.hpp"
#include "ledger.hpp"
#include <map>
#include <memory>
#include <string>

struct DerivedSnapshot;

// PostgreSQL-backed outcome ledger and sink for derived tables
class PostgresStore : public OutcomeLedger {
public:
    explicit PostgresStore(const Config& config);
    ~PostgresStore() override;

    bool is_connected() const;

    // Creates derived tables when missing
    bool ensure_schema();

    // Ledger read; throws RecomputeError(LedgerUnavailable) on failure
    LedgerSnapshot load_snapshot() override;

    // Writes every derived table in a single transaction; throws on failure
    void persist_snapshot(const DerivedSnapshot& snapshot);

    // Manual signal weight overrides
    std::map<std::string, double> load_overrides();
    bool save_override(const std::string& signal_name, double weight);
    bool delete_override(const std::string& signal_name);

    // Non-copyable
    PostgresStore(const PostgresStore&) = delete;
    PostgresStore& operator=(const PostgresStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
