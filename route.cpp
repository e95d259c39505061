#include "route.hpp"

#include <algorithm>
#include <sstream>

#include "planner_errors.hpp"

Route reconstruct_route(
  const SearchNodeArena & arena, const OccupancyGrid2D & grid, const Cell & start,
  const Cell & goal)
{
  Route route;
  const long long max_steps =
    static_cast<long long>(grid.get_size()) * static_cast<long long>(grid.get_size());

  Cell curr = goal;
  route.cells.push_back(curr);
  long long steps = 0;
  while (arena.at(curr).parent.has_value()) {
    if (++steps > max_steps) {
      std::ostringstream msg;
      msg << "Parent chain from " << goal << " exceeds " << max_steps << " steps.";
      throw InternalInconsistencyError(msg.str());
    }
    curr = *arena.at(curr).parent;
    route.cells.push_back(curr);
  }

  if (curr != start) {
    std::ostringstream msg;
    msg << "Parent chain from " << goal << " ends at " << curr << " instead of " << start << ".";
    throw InternalInconsistencyError(msg.str());
  }

  std::reverse(route.cells.begin(), route.cells.end());

  for (const auto & cell : route.cells) {
    if (!grid.is_passable(cell)) {
      route.obstacle_cells.push_back(cell);
    }
  }
  route.obstacles_crossed = static_cast<int>(route.obstacle_cells.size());

  if (route.obstacles_crossed != arena.at(goal).obstacles) {
    std::ostringstream msg;
    msg << "Route crosses " << route.obstacles_crossed << " obstacles but the goal node records "
        << arena.at(goal).obstacles << ".";
    throw InternalInconsistencyError(msg.str());
  }

  return route;
}
