/**
 * Pokemon Battle Arena Engine - Elixir Purchase Planner
 *
 * Turns a coin budget into elixir counts for the shopping phase.
 */

#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace arena {

using PriceTable = std::map<ElixirTier, int>;
using HealTable = std::map<ElixirTier, int>;

/**
 * PurchasePlan - Elixir counts plus totals. Total cost never exceeds the budget.
 */
struct PurchasePlan {
    std::map<ElixirTier, int> counts;
    int coins_spent = 0;
    long long total_heal = 0;

    int count(ElixirTier tier) const {
        auto it = counts.find(tier);
        return it != counts.end() ? it->second : 0;
    }

    std::string to_string() const;
};

/**
 * Tiers with both a positive price and a heal amount, ranked by heal per
 * coin descending (ties keep tier order).
 */
std::vector<ElixirTier> rank_by_heal_per_coin(const PriceTable& prices, const HealTable& heals);

/**
 * Plan purchases under `budget`.
 *
 * MAX_HEAL buys the combination with the largest total heal, preferring the
 * cheaper plan on equal heal. Large budgets are filled with the best-ratio
 * tier first so the search table stays bounded by the prices, not the
 * budget. GREEDY_RATIO walks the tiers in heal-per-coin
 * order and buys each as often as the remaining coins allow.
 *
 * Tiers missing from either table or priced at zero or below are skipped;
 * a negative budget buys nothing.
 */
PurchasePlan plan_purchases(int budget,
                            const PriceTable& prices,
                            const HealTable& heals,
                            PurchaseStrategy strategy = PurchaseStrategy::MAX_HEAL);

} // namespace arena
