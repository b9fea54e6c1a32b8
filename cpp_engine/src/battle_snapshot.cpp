/**
 * Pokemon Battle Arena Engine - Battle Snapshot Validation
 */

#include "battle_snapshot.hpp"
#include "errors.hpp"
#include <stdexcept>

namespace arena {

void validate_snapshot(const BattleSnapshot& snapshot) {
    for (SideId id = 0; id < NUM_SIDES; id++) {
        const SideState& side = snapshot.side(id);
        if (side.roster.empty()) {
            std::string name = side.trainer_name.empty()
                ? "side " + std::to_string(static_cast<int>(id))
                : side.trainer_name;
            throw EmptyRosterError("EmptyRoster: " + name + " has no combatants");
        }
        if (!side.roster.has_member(side.roster.active_index)) {
            throw std::out_of_range("active index " +
                                   std::to_string(side.roster.active_index) +
                                   " is outside the roster of side " +
                                   std::to_string(static_cast<int>(id)));
        }
    }
}

void validate_snapshot(const BattleSnapshot& snapshot, SideId side) {
    if (side >= NUM_SIDES) {
        throw std::out_of_range("side " + std::to_string(static_cast<int>(side)) +
                                " is not a battle side");
    }
    validate_snapshot(snapshot);
}

} // namespace arena
