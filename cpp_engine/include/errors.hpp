/**
 * Pokemon Battle Arena Engine - Error Types
 *
 * Recoverable failures (no path, missing config file) are returned as values.
 * The exceptions below mark contract violations by the caller or the engine.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace arena {

/**
 * A side was handed to the engine with zero combatants.
 * Raised before any computation starts.
 */
class EmptyRosterError : public std::invalid_argument {
public:
    explicit EmptyRosterError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * An action that is not in the legal set was applied to a snapshot.
 * Indicates a legality-check bug; never recovered.
 */
class IllegalActionError : public std::logic_error {
public:
    explicit IllegalActionError(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace arena
