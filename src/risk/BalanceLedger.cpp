#include "risk/BalanceLedger.h"
#include "common/Errors.h"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace spotbot {
namespace risk {

namespace {
constexpr double kAmountEpsilon = 1e-9;
}

std::uint64_t BalanceLedger::balanceEpoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commit_seq_;
}

bool BalanceLedger::syncBalance(const std::string& asset, double free_balance, std::uint64_t epoch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto applied = synced_epoch_.find(asset);
    if (applied != synced_epoch_.end() && epoch < applied->second) {
        return false;
    }
    syncLocked(asset, free_balance, epoch);
    return true;
}

void BalanceLedger::syncBalance(const std::string& asset, double free_balance) {
    std::lock_guard<std::mutex> lock(mutex_);
    syncLocked(asset, free_balance, commit_seq_);
}

void BalanceLedger::syncLocked(const std::string& asset, double free_balance, std::uint64_t epoch) {
    // A fill recorded after the reading may not be reflected in it. When it
    // is, the spend is counted twice until the next sync.
    double unseen = 0.0;
    for (const auto& record : recent_commits_) {
        if (record.asset == asset && record.seq > epoch) {
            unseen += record.amount;
        }
    }
    free_[asset] = std::max(0.0, free_balance - unseen);
    synced_epoch_[asset] = epoch;

    recent_commits_.erase(
        std::remove_if(recent_commits_.begin(), recent_commits_.end(),
                       [&](const CommitRecord& record) {
                           return record.asset == asset && record.seq <= epoch;
                       }),
        recent_commits_.end());
}

double BalanceLedger::freeBalance(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = free_.find(asset);
    return it != free_.end() ? it->second : 0.0;
}

double BalanceLedger::available(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = free_.find(asset);
    const double free_balance = it != free_.end() ? it->second : 0.0;
    return std::max(0.0, free_balance - inFlightLocked(asset));
}

void BalanceLedger::reserve(const TradingPair& pair,
                            const std::string& key,
                            const std::string& asset,
                            double amount,
                            double cap_pct) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (reservations_.count(key) > 0) {
        throw std::invalid_argument("duplicate reservation key " + key);
    }

    auto it = free_.find(asset);
    const double free_balance = it != free_.end() ? it->second : 0.0;
    const double available_amount = std::max(0.0, free_balance - inFlightLocked(asset));

    if (amount > available_amount + kAmountEpsilon) {
        std::ostringstream oss;
        oss << pair.toString() << ": need " << amount << " " << asset
            << ", available " << available_amount;
        throw InsufficientBalance(oss.str());
    }

    if (cap_pct > 0.0) {
        const double base = free_balance + committedLocked(asset);
        const double pair_total = reservedForLocked(pair, asset) + amount;
        if (pair_total > base * cap_pct + kAmountEpsilon) {
            std::ostringstream oss;
            oss << pair.toString() << ": " << pair_total << " " << asset
                << " would exceed the per-pair cap of " << base * cap_pct;
            throw InsufficientBalance(oss.str());
        }
    }

    Reservation reservation;
    reservation.key = key;
    reservation.pair = pair;
    reservation.asset = asset;
    reservation.amount = amount;
    reservations_.emplace(key, reservation);
}

void BalanceLedger::restore(const TradingPair& pair,
                            const std::string& key,
                            const std::string& asset,
                            double amount,
                            ReservationState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    Reservation reservation;
    reservation.key = key;
    reservation.pair = pair;
    reservation.asset = asset;
    reservation.amount = amount;
    reservation.state = state;
    reservations_[key] = reservation;
}

bool BalanceLedger::commit(const std::string& key, double actual_amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reservations_.find(key);
    if (it == reservations_.end()) {
        return false;
    }
    if (it->second.state == ReservationState::COMMITTED) {
        return true;
    }
    it->second.state = ReservationState::COMMITTED;
    if (actual_amount > 0.0) {
        it->second.amount = actual_amount;
    }

    const std::string& asset = it->second.asset;
    const double spent = it->second.amount;
    auto free_it = free_.find(asset);
    if (free_it != free_.end()) {
        free_it->second = std::max(0.0, free_it->second - spent);
    }
    CommitRecord record;
    record.seq = ++commit_seq_;
    record.asset = asset;
    record.amount = spent;
    recent_commits_.push_back(record);
    return true;
}

bool BalanceLedger::release(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return reservations_.erase(key) > 0;
}

bool BalanceLedger::hasReservation(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reservations_.count(key) > 0;
}

double BalanceLedger::reservedFor(const TradingPair& pair, const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reservedForLocked(pair, asset);
}

double BalanceLedger::committed(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return committedLocked(asset);
}

std::vector<BalanceLedger::Reservation> BalanceLedger::reservations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Reservation> out;
    out.reserve(reservations_.size());
    for (const auto& [key, reservation] : reservations_) {
        out.push_back(reservation);
    }
    return out;
}

double BalanceLedger::inFlightLocked(const std::string& asset) const {
    double total = 0.0;
    for (const auto& [key, reservation] : reservations_) {
        if (reservation.asset == asset && reservation.state == ReservationState::IN_FLIGHT) {
            total += reservation.amount;
        }
    }
    return total;
}

double BalanceLedger::committedLocked(const std::string& asset) const {
    double total = 0.0;
    for (const auto& [key, reservation] : reservations_) {
        if (reservation.asset == asset && reservation.state == ReservationState::COMMITTED) {
            total += reservation.amount;
        }
    }
    return total;
}

double BalanceLedger::reservedForLocked(const TradingPair& pair, const std::string& asset) const {
    double total = 0.0;
    for (const auto& [key, reservation] : reservations_) {
        if (reservation.pair == pair && reservation.asset == asset) {
            total += reservation.amount;
        }
    }
    return total;
}

} // namespace risk
} // namespace spotbot
