#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace swingfib {
namespace backtest {

// What happens to a position still open at the last bar.
enum class OpenPositionPolicy {
    CLOSE_AT_LAST_BAR,
    DROP
};

struct TradeIndices {
    std::vector<std::size_t> entries;
    std::vector<std::size_t> exits;   // exits[i] > entries[i]

    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }
};

enum class TradeEnumeratorKind {
    STATE_MACHINE,  // per-bar FLAT/LONG state machine
    SPARSE          // binary search over collected signal indices
};

// Flat-or-long trade pairing from entry/exit masks.
//
// FLAT -> LONG on an entry, LONG -> FLAT on an exit at a later bar. Entries
// while LONG are ignored and a bar that closes a position never opens one.
class ITradeEnumerator {
public:
    virtual ~ITradeEnumerator() = default;

    // Throws std::invalid_argument on mismatched lengths or when skip_first
    // is not inside the series. An entry on the last bar is never kept.
    TradeIndices enumerate(const std::vector<bool>& entry,
                           const std::vector<bool>& exit,
                           std::size_t skip_first,
                           OpenPositionPolicy policy) const;

    virtual std::string name() const = 0;

protected:
    // Pairs closed trades; returns the index of a dangling entry, or the
    // series length when flat at the end.
    virtual std::size_t pair(const std::vector<bool>& entry,
                             const std::vector<bool>& exit,
                             std::size_t skip_first,
                             TradeIndices& out) const = 0;
};

class StateMachineTradeEnumerator : public ITradeEnumerator {
public:
    std::string name() const override { return "state_machine"; }

protected:
    std::size_t pair(const std::vector<bool>& entry,
                     const std::vector<bool>& exit,
                     std::size_t skip_first,
                     TradeIndices& out) const override;
};

class SparseTradeEnumerator : public ITradeEnumerator {
public:
    std::string name() const override { return "sparse"; }

protected:
    std::size_t pair(const std::vector<bool>& entry,
                     const std::vector<bool>& exit,
                     std::size_t skip_first,
                     TradeIndices& out) const override;
};

std::unique_ptr<ITradeEnumerator> makeTradeEnumerator(TradeEnumeratorKind kind);

TradeEnumeratorKind tradeEnumeratorKindFromString(const std::string& value);
std::string toString(TradeEnumeratorKind kind);
OpenPositionPolicy openPositionPolicyFromString(const std::string& value);
std::string toString(OpenPositionPolicy policy);

} // namespace backtest
} // namespace swingfib
