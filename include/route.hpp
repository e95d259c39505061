#ifndef ROUTE_HPP
#define ROUTE_HPP

#include <vector>

#include "cell_2d.hpp"
#include "occupancy_grid_2d.hpp"
#include "search_node.hpp"

struct Route
{
  std::vector<Cell> cells;           // Start to goal, inclusive
  std::vector<Cell> obstacle_cells;  // Obstacles on the route, in route order
  int obstacles_crossed = 0;

  int steps() const { return static_cast<int>(cells.size()) - 1; }
};

/**
 * @brief Builds the route by following parent links back from the goal.
 *
 * @param arena Node arena of a search that reached the goal.
 * @param grid Grid the search ran on.
 * @param start Cell the walk must end at.
 * @param goal Cell the walk starts from.
 * @return Route Cells from start to goal and the obstacles on them.
 * @throws InternalInconsistencyError if the links do not reach the start
 * within size * size steps, or the obstacle tally disagrees with the goal
 * node.
 */
Route reconstruct_route(
  const SearchNodeArena & arena, const OccupancyGrid2D & grid, const Cell & start,
  const Cell & goal);

#endif  // ROUTE_HPP
