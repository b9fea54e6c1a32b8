/**
 * Pokemon Battle Arena Engine - Adversarial Search
 *
 * Depth-limited minimax with alpha-beta pruning over single-side plies.
 * The deciding side maximizes, the opponent is assumed to reply optimally.
 * Successor states come from BattleRules::apply_action with expected damage,
 * so the tree itself is deterministic; only the final tie-break among
 * equally scored root actions draws from the injected RandomSource.
 */

#pragma once

#include "battle_rules.hpp"
#include "fuzzy_advisor.hpp"

namespace arena {

struct ScoredAction {
    Action action;
    double score = 0.0;
};

/**
 * SearchResult - Chosen action plus search diagnostics.
 *
 * With pruning enabled only the scores of the best root actions are exact;
 * the others are upper bounds below the best score.
 */
struct SearchResult {
    Action action = Action::defend();
    double score = 0.0;
    std::vector<ScoredAction> root_scores;
    std::vector<Action> best_actions;   // every root action tied for the best score
    int nodes_visited = 0;
    bool searched = false;              // false for the defeated-side no-op
};

/**
 * AdversarialSearch - Minimax + alpha-beta decision maker.
 */
class AdversarialSearch {
public:
    static constexpr double TIE_EPSILON = 1e-9;

    explicit AdversarialSearch(const ArenaConfig& config);

    /**
     * Best action for `side` on `snapshot`, biased by `advice`.
     *
     * Depth defaults to the configured search depth and is at least 1.
     * A defeated side gets DEFEND without searching. Throws EmptyRosterError
     * if either roster is empty.
     */
    SearchResult decide(const BattleSnapshot& snapshot,
                        SideId side,
                        const Advice& advice,
                        RandomSource& rng,
                        std::optional<int> depth = std::nullopt) const;

    /**
     * Same tree without pruning. Used to verify that pruning leaves the
     * result unchanged.
     */
    SearchResult minimax_reference(const BattleSnapshot& snapshot,
                                   SideId side,
                                   const Advice& advice,
                                   RandomSource& rng,
                                   std::optional<int> depth = std::nullopt) const;

    /**
     * Static evaluation from `side`'s perspective, without fuzzy bias:
     * (own HP - enemy HP) + (own alive - enemy alive) * alive_weight.
     */
    double evaluate(const BattleSnapshot& snapshot, SideId side) const;

    const BattleRules& rules() const { return rules_; }

private:
    BattleRules rules_;
    SearchConfig search_;

    SearchResult run(const BattleSnapshot& snapshot,
                     SideId side,
                     const Advice& advice,
                     RandomSource& rng,
                     std::optional<int> depth,
                     bool prune) const;

    double search(const BattleSnapshot& node,
                  SideId root_side,
                  int depth,
                  bool maximizing,
                  double alpha,
                  double beta,
                  double bias,
                  bool prune,
                  int& nodes) const;
};

} // namespace arena
