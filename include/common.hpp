#ifndef COMMON_HPP
#define COMMON_HPP

#include <array>
#include <limits>
#include <string>

#include "cell_2d.hpp"

const int INF = std::numeric_limits<int>::max();

/**
 * @brief How the planner treats obstacle cells.
 *
 * STRICT - obstacles are walls, the search fails if every route is blocked.
 * RELAXED - obstacles can be crossed, the route crossing the fewest of them
 * wins and ties go to the shorter route.
 */
enum class SearchMode
{
  STRICT,
  RELAXED
};

enum class SearchState
{
  RUNNING,
  GOAL_REACHED,
  EXHAUSTED
};

// Fixed (dx, dy) enumeration order; tie-breaking depends on it.
const std::array<Cell, 8> kEightConnectedOffsets = {{
  {-1, -1}, {-1, 0}, {-1, 1}, {0, -1}, {0, 1}, {1, -1}, {1, 0}, {1, 1}}};

inline std::string to_string(SearchMode mode)
{
  return (mode == SearchMode::STRICT) ? "strict" : "relaxed";
}

inline std::string to_string(SearchState state)
{
  switch (state) {
    case SearchState::RUNNING:
      return "running";
    case SearchState::GOAL_REACHED:
      return "goal reached";
    case SearchState::EXHAUSTED:
      return "exhausted";
  }
  return "unknown";
}

#endif // COMMON_HPP
