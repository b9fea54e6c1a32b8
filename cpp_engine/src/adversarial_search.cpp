/**
 * Pokemon Battle Arena Engine - Adversarial Search Implementation
 */

#include "adversarial_search.hpp"
#include <algorithm>
#include <limits>

namespace arena {

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

// Root children are searched with alpha just below the running best so that
// a child tying the best comes back with its exact value.
constexpr double ROOT_WINDOW = 1e-6;

} // namespace

AdversarialSearch::AdversarialSearch(const ArenaConfig& config)
    : rules_(config)
    , search_(config.search)
{}

double AdversarialSearch::evaluate(const BattleSnapshot& snapshot, SideId side) const {
    const Roster& own = snapshot.side(side).roster;
    const Roster& enemy = snapshot.opponent(side).roster;

    double hp_diff = own.total_hp() - enemy.total_hp();
    double alive_diff = own.alive_count() - enemy.alive_count();
    return hp_diff + alive_diff * search_.alive_weight;
}

double AdversarialSearch::search(const BattleSnapshot& node,
                                 SideId root_side,
                                 int depth,
                                 bool maximizing,
                                 double alpha,
                                 double beta,
                                 double bias,
                                 bool prune,
                                 int& nodes) const {
    nodes++;

    if (depth <= 0 || node.is_over()) {
        return evaluate(node, root_side) + bias;
    }

    const SideId mover = maximizing ? root_side : opponent_of(root_side);
    const std::vector<Action> actions = rules_.legal_actions(node, mover);

    if (maximizing) {
        double best = -INF;
        for (const auto& action : actions) {
            BattleSnapshot child = rules_.apply_action(node, mover, action);
            double value = search(child, root_side, depth - 1, false, alpha, beta, bias, prune, nodes);
            best = std::max(best, value);
            alpha = std::max(alpha, best);
            if (prune && alpha >= beta) {
                break;
            }
        }
        return best;
    }

    double best = INF;
    for (const auto& action : actions) {
        BattleSnapshot child = rules_.apply_action(node, mover, action);
        double value = search(child, root_side, depth - 1, true, alpha, beta, bias, prune, nodes);
        best = std::min(best, value);
        beta = std::min(beta, best);
        if (prune && alpha >= beta) {
            break;
        }
    }
    return best;
}

SearchResult AdversarialSearch::run(const BattleSnapshot& snapshot,
                                    SideId side,
                                    const Advice& advice,
                                    RandomSource& rng,
                                    std::optional<int> depth,
                                    bool prune) const {
    validate_snapshot(snapshot, side);

    // A fainted active is replaced before the search models any attack
    BattleSnapshot root = snapshot;
    root.normalize_actives();
    root.to_move = side;

    SearchResult result;

    if (root.side(side).is_defeated()) {
        result.action = Action::defend();
        result.best_actions = {result.action};
        result.score = evaluate(root, side);
        return result;
    }

    const int max_depth = std::max(1, depth.value_or(search_.depth));

    const std::vector<Action> actions = rules_.legal_actions(root, side);

    double best = -INF;
    for (const auto& action : actions) {
        const double bias = advice.weight_for(action.action_type) * search_.fuzzy_bias_scale;
        const double alpha = prune ? best - ROOT_WINDOW : -INF;

        BattleSnapshot child = rules_.apply_action(root, side, action);
        double value = search(child, side, max_depth - 1, false, alpha, INF, bias, prune,
                              result.nodes_visited);

        result.root_scores.push_back({action, value});
        best = std::max(best, value);
    }

    for (const auto& scored : result.root_scores) {
        if (scored.score >= best - TIE_EPSILON) {
            result.best_actions.push_back(scored.action);
        }
    }

    result.score = best;
    result.action = result.best_actions[rng.pick(result.best_actions.size())];
    result.searched = true;
    result.nodes_visited++;  // root
    return result;
}

SearchResult AdversarialSearch::decide(const BattleSnapshot& snapshot,
                                       SideId side,
                                       const Advice& advice,
                                       RandomSource& rng,
                                       std::optional<int> depth) const {
    return run(snapshot, side, advice, rng, depth, true);
}

SearchResult AdversarialSearch::minimax_reference(const BattleSnapshot& snapshot,
                                                  SideId side,
                                                  const Advice& advice,
                                                  RandomSource& rng,
                                                  std::optional<int> depth) const {
    return run(snapshot, side, advice, rng, depth, false);
}

} // namespace arena
