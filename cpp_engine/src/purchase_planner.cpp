/**
 * Pokemon Battle Arena Engine - Elixir Purchase Planner Implementation
 */

#include "purchase_planner.hpp"
#include <algorithm>
#include <sstream>

namespace arena {

std::string PurchasePlan::to_string() const {
    std::ostringstream out;
    bool first = true;
    for (const auto& [tier, n] : counts) {
        if (n <= 0) continue;
        if (!first) out << ", ";
        out << n << "x" << arena::to_string(tier);
        first = false;
    }
    if (first) {
        out << "none";
    }
    out << " (" << coins_spent << " coins, " << total_heal << " HP)";
    return out.str();
}

std::vector<ElixirTier> rank_by_heal_per_coin(const PriceTable& prices, const HealTable& heals) {
    std::vector<ElixirTier> tiers;
    for (const auto& [tier, price] : prices) {
        auto heal = heals.find(tier);
        if (price > 0 && heal != heals.end() && heal->second > 0) {
            tiers.push_back(tier);
        }
    }

    // Compare heal_a / price_a against heal_b / price_b without division
    std::stable_sort(tiers.begin(), tiers.end(), [&](ElixirTier a, ElixirTier b) {
        long long lhs = static_cast<long long>(heals.at(a)) * prices.at(b);
        long long rhs = static_cast<long long>(heals.at(b)) * prices.at(a);
        return lhs > rhs;
    });
    return tiers;
}

namespace {

PurchasePlan plan_greedy(int budget,
                         const std::vector<ElixirTier>& ranked,
                         const PriceTable& prices,
                         const HealTable& heals) {
    PurchasePlan plan;
    int coins = budget;

    for (ElixirTier tier : ranked) {
        const int price = prices.at(tier);
        const int n = coins / price;
        if (n > 0) {
            plan.counts[tier] += n;
            coins -= n * price;
            plan.coins_spent += n * price;
            plan.total_heal += static_cast<long long>(n) * heals.at(tier);
        }
    }
    return plan;
}

PurchasePlan plan_max_heal(int budget,
                           const std::vector<ElixirTier>& ranked,
                           const PriceTable& prices,
                           const HealTable& heals) {
    PurchasePlan plan;

    // Some optimal plan holds fewer than best_price units of the other tiers:
    // any best_price of them contain a subset whose cost is a multiple of
    // best_price, and swapping that subset for best-ratio units never loses
    // heal. Spend beyond that window therefore goes to the best-ratio tier.
    const ElixirTier best = ranked.front();
    const long long best_price = prices.at(best);
    long long max_price = 0;
    for (ElixirTier tier : ranked) {
        max_price = std::max<long long>(max_price, prices.at(tier));
    }
    const long long window = best_price * max_price;

    int remaining = budget;
    if (budget > window) {
        const int bulk = static_cast<int>((budget - window) / best_price);
        plan.counts[best] += bulk;
        plan.coins_spent += static_cast<int>(bulk * best_price);
        plan.total_heal += static_cast<long long>(bulk) * heals.at(best);
        remaining = budget - static_cast<int>(bulk * best_price);
    }

    // Unbounded knapsack on exact spend: heal_at[c] is the best heal costing exactly c
    const long long UNREACHABLE = -1;
    const size_t table_size = static_cast<size_t>(remaining) + 1;
    std::vector<long long> heal_at(table_size, UNREACHABLE);
    std::vector<int> last_tier(table_size, -1);
    heal_at[0] = 0;

    for (long long c = 1; c <= remaining; c++) {
        for (size_t i = 0; i < ranked.size(); i++) {
            const int price = prices.at(ranked[i]);
            if (price > c || heal_at[c - price] == UNREACHABLE) {
                continue;
            }
            long long candidate = heal_at[c - price] + heals.at(ranked[i]);
            if (candidate > heal_at[c]) {
                heal_at[c] = candidate;
                last_tier[c] = static_cast<int>(i);
            }
        }
    }

    // Largest heal, cheapest on ties
    int best_spend = 0;
    for (long long c = 1; c <= remaining; c++) {
        if (heal_at[c] > heal_at[best_spend]) {
            best_spend = static_cast<int>(c);
        }
    }

    plan.coins_spent += best_spend;
    plan.total_heal += heal_at[best_spend];

    for (int c = best_spend; c > 0; ) {
        ElixirTier tier = ranked[last_tier[c]];
        plan.counts[tier]++;
        c -= prices.at(tier);
    }
    return plan;
}

} // namespace

PurchasePlan plan_purchases(int budget,
                            const PriceTable& prices,
                            const HealTable& heals,
                            PurchaseStrategy strategy) {
    const std::vector<ElixirTier> ranked = rank_by_heal_per_coin(prices, heals);

    PurchasePlan plan;
    if (budget > 0 && !ranked.empty()) {
        plan = strategy == PurchaseStrategy::GREEDY_RATIO
            ? plan_greedy(budget, ranked, prices, heals)
            : plan_max_heal(budget, ranked, prices, heals);
    }

    // Report every priced tier, including the ones not bought
    for (ElixirTier tier : ranked) {
        plan.counts.emplace(tier, 0);
    }
    return plan;
}

} // namespace arena
