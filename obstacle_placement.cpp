#include "obstacle_placement.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

std::vector<Cell> place_random_obstacles(
  OccupancyGrid2D & grid, int count, const Cell & start, const Cell & goal, std::mt19937 & rng)
{
  if (count < 0) {
    throw std::invalid_argument("Obstacle count must not be negative.");
  }

  std::vector<Cell> options;
  for (int x = 0; x < grid.get_size(); x++) {
    for (int y = 0; y < grid.get_size(); y++) {
      Cell cell(x, y);
      if (cell != start && cell != goal && grid.is_passable(cell)) {
        options.push_back(cell);
      }
    }
  }

  std::size_t n = std::min(static_cast<std::size_t>(count), options.size());
  std::vector<Cell> placed;
  placed.reserve(n);

  // Partial Fisher-Yates: the first i entries are the ones already chosen.
  for (std::size_t i = 0; i < n; i++) {
    std::uniform_int_distribution<std::size_t> pick(i, options.size() - 1);
    std::swap(options[i], options[pick(rng)]);
    grid.set_obstacle(options[i]);
    placed.push_back(options[i]);
  }

  return placed;
}

void place_obstacles(OccupancyGrid2D & grid, const std::vector<Cell> & cells)
{
  for (const auto & cell : cells) {
    grid.set_obstacle(cell);
  }
}
