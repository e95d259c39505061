#ifndef OBSTACLE_PLACEMENT_HPP
#define OBSTACLE_PLACEMENT_HPP

#include <random>
#include <vector>

#include "cell_2d.hpp"
#include "occupancy_grid_2d.hpp"

/**
 * @brief Marks count random free cells as obstacles, never the start or the
 * goal. When fewer free cells remain, all of them are used.
 *
 * @return std::vector<Cell> Cells that became obstacles, in placement order.
 */
std::vector<Cell> place_random_obstacles(
  OccupancyGrid2D & grid, int count, const Cell & start, const Cell & goal, std::mt19937 & rng);

/**
 * @brief Marks each listed cell as an obstacle.
 * @throws std::out_of_range if a cell is outside the grid.
 */
void place_obstacles(OccupancyGrid2D & grid, const std::vector<Cell> & cells);

#endif  // OBSTACLE_PLACEMENT_HPP
