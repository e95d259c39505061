#ifndef OCCUPANCY_GRID_2D_HPP
#define OCCUPANCY_GRID_2D_HPP

#include <cstdint>
#include <memory>
#include <vector>

#include "cell_2d.hpp"

/**
 * @brief Square grid of free and obstacle cells.
 *
 * The side length is fixed at construction. Obstacles may be placed or
 * cleared between searches, never while one is running.
 */
class OccupancyGrid2D
{
public:
  static constexpr uint8_t kFree = 0;
  static constexpr uint8_t kObstacle = 1;

  explicit OccupancyGrid2D(int size);

  /**
   * @brief Construct from row-major occupancy values, index y * size + x.
   * Any non-zero value is an obstacle.
   */
  OccupancyGrid2D(int size, const std::vector<uint8_t> & data);

  bool in_bounds(const Cell & coords) const;

  bool is_passable(const Cell & coords) const;

  void set_obstacle(const Cell & coords, bool obstacle = true);

  int get_size() const;

  int count_obstacles() const;

  std::vector<Cell> obstacle_cells() const;

  /**
   * @brief Row-major index of an in-bounds cell, used to address per-cell
   * search state.
   */
  std::size_t index_of(const Cell & coords) const;

private:
  int size_;
  std::shared_ptr<std::vector<uint8_t>> data_;
};

#endif // OCCUPANCY_GRID_2D_HPP
