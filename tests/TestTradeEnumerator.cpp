#include "backtest/TradeEnumerator.h"

#include <cassert>
#include <initializer_list>
#include <iostream>
#include <random>
#include <stdexcept>

using namespace swingfib::backtest;

namespace {

std::vector<bool> mask(std::initializer_list<int> bits) {
    std::vector<bool> out;
    for (int b : bits) out.push_back(b != 0);
    return out;
}

using Idx = std::vector<std::size_t>;

} // namespace

int main() {
    const StateMachineTradeEnumerator machine;
    const SparseTradeEnumerator sparse;
    const ITradeEnumerator* both[] = {&machine, &sparse};

    for (const ITradeEnumerator* e : both) {
        // Two clean round trips
        {
            const auto t = e->enumerate(mask({0, 1, 0, 0, 1, 0}), mask({0, 0, 1, 0, 0, 1}),
                                        0, OpenPositionPolicy::DROP);
            assert((t.entries == Idx{1, 4}));
            assert((t.exits == Idx{2, 5}));
        }

        // Entries while long are ignored; exits while flat are ignored
        {
            const auto t = e->enumerate(mask({0, 1, 1, 1, 0, 0, 1, 0}), mask({1, 0, 0, 0, 1, 1, 0, 1}),
                                        0, OpenPositionPolicy::DROP);
            assert((t.entries == Idx{1, 6}));
            assert((t.exits == Idx{4, 7}));
        }

        // A bar that closes a position never opens one
        {
            const auto t = e->enumerate(mask({1, 0, 1, 0}), mask({0, 0, 1, 1}),
                                        0, OpenPositionPolicy::DROP);
            assert((t.entries == Idx{0}));
            assert((t.exits == Idx{2}));
        }

        // Dangling position under both policies
        {
            const auto entry = mask({0, 1, 0, 0, 0});
            const auto exit = mask({0, 0, 0, 0, 0});
            const auto closed = e->enumerate(entry, exit, 0, OpenPositionPolicy::CLOSE_AT_LAST_BAR);
            assert((closed.entries == Idx{1}));
            assert((closed.exits == Idx{4}));
            const auto dropped = e->enumerate(entry, exit, 0, OpenPositionPolicy::DROP);
            assert(dropped.empty());
        }

        // Entry on the last bar cannot be closed later
        {
            const auto entry = mask({0, 1, 0, 0, 1});
            const auto exit = mask({0, 0, 1, 0, 0});
            const auto closed = e->enumerate(entry, exit, 0, OpenPositionPolicy::CLOSE_AT_LAST_BAR);
            assert(closed.size() == 1);
            assert(closed.entries[0] == 1 && closed.exits[0] == 2);
        }

        // skip_first hides leading signals
        {
            const auto t = e->enumerate(mask({1, 0, 1, 0, 0}), mask({0, 1, 0, 1, 0}),
                                        1, OpenPositionPolicy::DROP);
            assert((t.entries == Idx{2}));
            assert((t.exits == Idx{3}));
        }

        // Shape errors and the empty series
        {
            assert(e->enumerate({}, {}, 0, OpenPositionPolicy::CLOSE_AT_LAST_BAR).empty());

            bool threw_len = false;
            try {
                e->enumerate(mask({1, 0}), mask({0}), 0, OpenPositionPolicy::DROP);
            } catch (const std::invalid_argument&) {
                threw_len = true;
            }
            assert(threw_len);

            bool threw_skip = false;
            try {
                e->enumerate(mask({1, 0, 1}), mask({0, 1, 0}), 3, OpenPositionPolicy::DROP);
            } catch (const std::invalid_argument&) {
                threw_skip = true;
            }
            assert(threw_skip);
        }
    }

    // Sparse pairing matches the state machine on random masks
    {
        std::mt19937 rng(1234);
        for (int trial = 0; trial < 500; ++trial) {
            const std::size_t n = 1 + rng() % 300;
            const double p_entry = 0.02 + 0.3 * (trial % 7) / 7.0;
            const double p_exit = 0.02 + 0.3 * (trial % 5) / 5.0;
            std::bernoulli_distribution entry_dist(p_entry);
            std::bernoulli_distribution exit_dist(p_exit);

            std::vector<bool> entry(n);
            std::vector<bool> exit(n);
            for (std::size_t i = 0; i < n; ++i) {
                entry[i] = entry_dist(rng);
                exit[i] = exit_dist(rng);
            }
            const std::size_t skip = rng() % n;

            for (auto policy : {OpenPositionPolicy::CLOSE_AT_LAST_BAR, OpenPositionPolicy::DROP}) {
                const auto expected = machine.enumerate(entry, exit, skip, policy);
                const auto got = sparse.enumerate(entry, exit, skip, policy);
                assert(got.entries == expected.entries);
                assert(got.exits == expected.exits);

                for (std::size_t i = 0; i < expected.size(); ++i) {
                    assert(expected.entries[i] >= skip);
                    assert(expected.entries[i] < expected.exits[i]);
                    if (i > 0) {
                        assert(expected.entries[i] > expected.exits[i - 1]);
                    }
                }
            }
        }
    }

    {
        assert(makeTradeEnumerator(TradeEnumeratorKind::SPARSE)->name() == "sparse");
        assert(tradeEnumeratorKindFromString("state_machine") == TradeEnumeratorKind::STATE_MACHINE);
        assert(openPositionPolicyFromString("drop") == OpenPositionPolicy::DROP);
        assert(toString(OpenPositionPolicy::CLOSE_AT_LAST_BAR) == "close_at_last_bar");
        bool threw = false;
        try {
            openPositionPolicyFromString("keep_open");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] TradeEnumerator PASSED\n";
    return 0;
}
