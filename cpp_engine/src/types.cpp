/**
 * Pokemon Battle Arena Engine - Type Parsing
 */

#include "types.hpp"
#include <algorithm>
#include <cctype>

namespace arena {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::optional<ElementType> parse_element_type(const std::string& s) {
    std::string lower = lowercase(s);
    if (lower == "fire") return ElementType::FIRE;
    if (lower == "water") return ElementType::WATER;
    if (lower == "electric" || lower == "lightning") return ElementType::ELECTRIC;
    return std::nullopt;
}

std::optional<ElixirTier> parse_elixir_tier(const std::string& s) {
    std::string lower = lowercase(s);
    if (lower == "small") return ElixirTier::SMALL;
    if (lower == "medium") return ElixirTier::MEDIUM;
    if (lower == "large") return ElixirTier::LARGE;
    return std::nullopt;
}

std::optional<ActionType> parse_action_type(const std::string& s) {
    std::string lower = lowercase(s);
    if (lower == "attack") return ActionType::ATTACK;
    if (lower == "defend") return ActionType::DEFEND;
    if (lower == "heal") return ActionType::HEAL;
    if (lower == "swap") return ActionType::SWAP;
    return std::nullopt;
}

std::optional<PurchaseStrategy> parse_purchase_strategy(const std::string& s) {
    std::string lower = lowercase(s);
    if (lower == "max_heal") return PurchaseStrategy::MAX_HEAL;
    if (lower == "greedy_ratio" || lower == "greedy") return PurchaseStrategy::GREEDY_RATIO;
    return std::nullopt;
}

std::optional<HpBand> parse_hp_band(const std::string& s) {
    std::string lower = lowercase(s);
    if (lower == "low") return HpBand::LOW;
    if (lower == "medium") return HpBand::MEDIUM;
    if (lower == "high") return HpBand::HIGH;
    return std::nullopt;
}

std::optional<AdviceKind> parse_advice_kind(const std::string& s) {
    std::string lower = lowercase(s);
    if (lower == "heal") return AdviceKind::HEAL;
    if (lower == "swap") return AdviceKind::SWAP;
    return std::nullopt;
}

} // namespace arena
