/**
 * Shared fixtures for the engine tests
 */

#pragma once

#include "arena_engine.hpp"
#include <deque>

using namespace arena;

// Random source with scripted answers, for exact damage and tie-break checks
class FixedRandom : public RandomSource {
public:
    explicit FixedRandom(double jitter = 1.0, size_t pick_index = 0)
        : jitter_(jitter), pick_index_(pick_index) {}

    double uniform(double lo, double hi) override {
        return std::clamp(jitter_, lo, hi);
    }

    int range(int lo, int hi) override {
        (void)hi;
        return lo;
    }

    size_t pick(size_t n) override {
        picks++;
        return n == 0 ? 0 : std::min(pick_index_, n - 1);
    }

    int picks = 0;

private:
    double jitter_;
    size_t pick_index_;
};

inline Combatant make_combatant(const std::string& name, ElementType type, int hp = 100) {
    Combatant c(name, type, 100, 22, 10);
    c.hp = hp;
    return c;
}

inline BattleSnapshot make_snapshot(std::vector<Combatant> side0,
                                    std::vector<Combatant> side1,
                                    ElementType field = ElementType::WATER) {
    BattleSnapshot snapshot;
    snapshot.sides[0].trainer_name = "Ash";
    snapshot.sides[0].roster = Roster(std::move(side0));
    snapshot.sides[1].trainer_name = "Team Rocket";
    snapshot.sides[1].roster = Roster(std::move(side1));
    snapshot.field_type = field;
    return snapshot;
}

// Three-a-side default teams at full health
inline BattleSnapshot default_snapshot() {
    return make_snapshot(
        {make_combatant("Pikachu", ElementType::ELECTRIC),
         make_combatant("Charmander", ElementType::FIRE),
         make_combatant("Squirtle", ElementType::WATER)},
        {make_combatant("Meowth", ElementType::ELECTRIC),
         make_combatant("Weezing", ElementType::FIRE),
         make_combatant("Wobbuffet", ElementType::WATER)});
}

// Shortest path length by breadth-first search, -1 if unreachable
inline int bfs_distance(const Grid& grid, const Cell& start, const Cell& goal) {
    if (!grid.is_passable(start) || !grid.is_passable(goal)) return -1;

    std::vector<int> dist(grid.cell_count(), -1);
    std::deque<Cell> queue;
    dist[grid.index_of(start)] = 0;
    queue.push_back(start);

    while (!queue.empty()) {
        Cell cell = queue.front();
        queue.pop_front();
        if (cell == goal) return dist[grid.index_of(cell)];

        const int dr[] = {1, -1, 0, 0};
        const int dc[] = {0, 0, 1, -1};
        for (int i = 0; i < 4; i++) {
            Cell next(cell.row + dr[i], cell.col + dc[i]);
            if (grid.is_passable(next) && dist[grid.index_of(next)] < 0) {
                dist[grid.index_of(next)] = dist[grid.index_of(cell)] + 1;
                queue.push_back(next);
            }
        }
    }
    return -1;
}
