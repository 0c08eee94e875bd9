#include "backtest/TradeEnumerator.h"

#include <algorithm>
#include <stdexcept>

namespace swingfib {
namespace backtest {

TradeIndices ITradeEnumerator::enumerate(const std::vector<bool>& entry,
                                         const std::vector<bool>& exit,
                                         std::size_t skip_first,
                                         OpenPositionPolicy policy) const {
    if (entry.size() != exit.size()) {
        throw std::invalid_argument(
            "trade enumerator: entry (" + std::to_string(entry.size()) +
            ") and exit (" + std::to_string(exit.size()) + ") masks differ in length");
    }

    TradeIndices out;
    const std::size_t n = entry.size();
    if (n == 0 && skip_first == 0) {
        return out;
    }
    if (skip_first >= n) {
        throw std::invalid_argument(
            "trade enumerator: skip_first (" + std::to_string(skip_first) +
            ") must be less than the series length (" + std::to_string(n) + ")");
    }

    const std::size_t dangling = pair(entry, exit, skip_first, out);
    if (dangling < n && policy == OpenPositionPolicy::CLOSE_AT_LAST_BAR && dangling + 1 < n) {
        out.entries.push_back(dangling);
        out.exits.push_back(n - 1);
    }
    return out;
}

std::size_t StateMachineTradeEnumerator::pair(const std::vector<bool>& entry,
                                              const std::vector<bool>& exit,
                                              std::size_t skip_first,
                                              TradeIndices& out) const {
    const std::size_t n = entry.size();
    bool long_open = false;
    std::size_t open_index = n;

    for (std::size_t i = skip_first; i < n; ++i) {
        if (long_open && exit[i]) {
            out.entries.push_back(open_index);
            out.exits.push_back(i);
            long_open = false;
            open_index = n;
        } else if (!long_open && entry[i]) {
            long_open = true;
            open_index = i;
        }
    }
    return open_index;
}

std::size_t SparseTradeEnumerator::pair(const std::vector<bool>& entry,
                                        const std::vector<bool>& exit,
                                        std::size_t skip_first,
                                        TradeIndices& out) const {
    const std::size_t n = entry.size();
    std::vector<std::size_t> entry_bars;
    std::vector<std::size_t> exit_bars;
    for (std::size_t i = skip_first; i < n; ++i) {
        if (entry[i]) entry_bars.push_back(i);
        if (exit[i]) exit_bars.push_back(i);
    }

    std::size_t cursor = skip_first;
    while (true) {
        const auto e = std::lower_bound(entry_bars.begin(), entry_bars.end(), cursor);
        if (e == entry_bars.end()) {
            return n;
        }
        const auto x = std::upper_bound(exit_bars.begin(), exit_bars.end(), *e);
        if (x == exit_bars.end()) {
            return *e;
        }
        out.entries.push_back(*e);
        out.exits.push_back(*x);
        // 청산 바에서는 재진입하지 않음
        cursor = *x + 1;
    }
}

std::unique_ptr<ITradeEnumerator> makeTradeEnumerator(TradeEnumeratorKind kind) {
    switch (kind) {
        case TradeEnumeratorKind::SPARSE:
            return std::make_unique<SparseTradeEnumerator>();
        case TradeEnumeratorKind::STATE_MACHINE:
        default:
            return std::make_unique<StateMachineTradeEnumerator>();
    }
}

TradeEnumeratorKind tradeEnumeratorKindFromString(const std::string& value) {
    if (value == "state_machine") {
        return TradeEnumeratorKind::STATE_MACHINE;
    }
    if (value == "sparse") {
        return TradeEnumeratorKind::SPARSE;
    }
    throw std::invalid_argument("unknown trade enumerator: " + value);
}

std::string toString(TradeEnumeratorKind kind) {
    return kind == TradeEnumeratorKind::SPARSE ? "sparse" : "state_machine";
}

OpenPositionPolicy openPositionPolicyFromString(const std::string& value) {
    if (value == "close_at_last_bar") {
        return OpenPositionPolicy::CLOSE_AT_LAST_BAR;
    }
    if (value == "drop") {
        return OpenPositionPolicy::DROP;
    }
    throw std::invalid_argument("unknown open position policy: " + value);
}

std::string toString(OpenPositionPolicy policy) {
    return policy == OpenPositionPolicy::DROP ? "drop" : "close_at_last_bar";
}

} // namespace backtest
} // namespace swingfib
