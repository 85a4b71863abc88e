#pragma once

#include "common/Types.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace spotbot {
namespace risk {

// Single arbiter for capital shared by pair workers.
//
// A reservation is taken (IN_FLIGHT) before an order is submitted, becomes
// COMMITTED when the entry fills and is released when the position closes or
// the order is cancelled. IN_FLIGHT amounts are subtracted from the synced free
// balance; COMMITTED amounts are debited from it when the fill is recorded.
//
// Every commit gets a sequence number. A balance reading carries the sequence
// observed before it was requested, and commits recorded after that point are
// subtracted from it: another worker's fill may have landed in between.
class BalanceLedger {
public:
    enum class ReservationState { IN_FLIGHT, COMMITTED };

    struct Reservation {
        std::string key;
        TradingPair pair;
        std::string asset;
        double amount = 0.0;
        ReservationState state = ReservationState::IN_FLIGHT;
    };

    // Sequence of the last commit. Read it before requesting a balance.
    std::uint64_t balanceEpoch() const;

    // Free balance reported by the exchange, requested after `epoch` was read.
    // A reading older than the one already applied for `asset` is dropped
    // (returns false).
    bool syncBalance(const std::string& asset, double free_balance, std::uint64_t epoch);

    // Reading taken with no commit in between
    void syncBalance(const std::string& asset, double free_balance);
    double freeBalance(const std::string& asset) const;

    // free - in-flight reservations, never negative
    double available(const std::string& asset) const;

    // Atomically checks and reserves. Throws InsufficientBalance when `amount`
    // exceeds what is available, or when the pair's total reservations would
    // exceed cap_pct of (free + committed). Throws std::invalid_argument on a
    // duplicate key.
    void reserve(const TradingPair& pair,
                 const std::string& key,
                 const std::string& asset,
                 double amount,
                 double cap_pct);

    // Same as reserve() but skips checks; used to restore recovered positions.
    void restore(const TradingPair& pair,
                 const std::string& key,
                 const std::string& asset,
                 double amount,
                 ReservationState state);

    // Entry filled: amount becomes the actual quote spent and is debited from
    // the free balance. False if unknown key.
    bool commit(const std::string& key, double actual_amount);

    // False if the key was not reserved
    bool release(const std::string& key);

    bool hasReservation(const std::string& key) const;
    double reservedFor(const TradingPair& pair, const std::string& asset) const;
    double committed(const std::string& asset) const;
    std::vector<Reservation> reservations() const;

private:
    struct CommitRecord {
        std::uint64_t seq = 0;
        std::string asset;
        double amount = 0.0;
    };

    mutable std::mutex mutex_;
    std::map<std::string, double> free_;
    std::map<std::string, Reservation> reservations_;

    std::uint64_t commit_seq_ = 0;
    std::vector<CommitRecord> recent_commits_;       // not yet covered by a sync
    std::map<std::string, std::uint64_t> synced_epoch_;

    void syncLocked(const std::string& asset, double free_balance, std::uint64_t epoch);

    double inFlightLocked(const std::string& asset) const;
    double committedLocked(const std::string& asset) const;
    double reservedForLocked(const TradingPair& pair, const std::string& asset) const;
};

} // namespace risk
} // namespace spotbot
