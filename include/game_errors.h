#pragma once

#include <stdexcept>
#include <string>

// A policy proposed a move that breaks ownership, adjacency or troop-count rules.
// Only raised when the engine runs with strictMoves; otherwise rejections are recorded.
class InvalidMoveError : public std::runtime_error {
public:
    explicit InvalidMoveError(const std::string& what) : std::runtime_error(what) {}
};

// applyTradeIn received cards that do not form a tradeable set.
class CardSetError : public std::runtime_error {
public:
    explicit CardSetError(const std::string& what) : std::runtime_error(what) {}
};

// Unsupported player count, unknown policy name, or any other setup-time fault.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Map description could not be read or references something that does not exist.
class LoadError : public std::runtime_error {
public:
    explicit LoadError(const std::string& what) : std::runtime_error(what) {}
};
