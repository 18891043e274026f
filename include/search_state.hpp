#pragma once
#include "types.hpp"
#include "search_options.hpp"
#include <cstddef>
#include <vector>

// Node and backtrack allowance for one search. Every candidate evaluation
// calls visit() first; a false return means the search must stop.
struct SearchBudget {
    int max_nodes;
    int max_backtracks;
    int nodes = 0;
    int backtracks = 0;

    SearchBudget(int max_nodes_, int max_backtracks_)
        : max_nodes(max_nodes_), max_backtracks(max_backtracks_) {}

    bool visit() {
        if (nodes >= max_nodes) return false;
        ++nodes;
        return true;
    }
    bool can_backtrack() const { return backtracks < max_backtracks && nodes < max_nodes; }
    void note_backtrack() { ++backtracks; }
    bool nodes_exhausted() const { return nodes >= max_nodes; }
};

// Multiplier and remainder sequences of one in-flight search.
// remainders[0] is the seed, so remainders.size() == multipliers.size() + 1
// at all times. Forward steps append; a backtrack truncates and then appends.
class SearchState {
public:
    SearchState(u64 seed, u64 modulus, const SearchOptions &opts)
        : budget(opts.max_nodes, opts.max_backtracks), modulus_(modulus) {
        remainders_.push_back(seed);
    }

    u64 modulus() const { return modulus_; }
    u64 seed() const { return remainders_.front(); }
    u64 last_remainder() const { return remainders_.back(); }
    size_t steps() const { return multipliers_.size(); }
    unsigned generation() const { return generation_; }

    const std::vector<u64>& multipliers() const { return multipliers_; }
    const std::vector<u64>& remainders() const { return remainders_; }

    void push_step(u64 k, u64 r) {
        multipliers_.push_back(k);
        remainders_.push_back(r);
    }

    // Keep the first `keep` steps; remainders keep the seed plus `keep` values.
    void truncate(size_t keep) {
        if (keep >= multipliers_.size()) return;
        multipliers_.resize(keep);
        remainders_.resize(keep + 1);
        ++generation_;
    }

    // Index of the earliest odd multiplier, or -1.
    long earliest_odd_multiplier() const {
        for (size_t i = 0; i < multipliers_.size(); ++i) {
            if (multipliers_[i] & 1ull) return (long)i;
        }
        return -1;
    }

    SearchBudget budget;

private:
    u64 modulus_;
    unsigned generation_ = 0;
    std::vector<u64> multipliers_;
    std::vector<u64> remainders_;
};
