#include "occupancy_grid_2d.hpp"

#include <algorithm>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

namespace
{

// Cell counts are held in int elsewhere, so size * size must fit.
std::size_t checked_cell_count(int size)
{
  if (size <= 0) {
    throw std::invalid_argument("Grid size must be positive, got " + std::to_string(size));
  }
  long long cells = static_cast<long long>(size) * static_cast<long long>(size);
  if (cells > std::numeric_limits<int>::max()) {
    throw std::invalid_argument("Grid size " + std::to_string(size) + " is too large.");
  }
  return static_cast<std::size_t>(cells);
}

}  // namespace

OccupancyGrid2D::OccupancyGrid2D(int size) : size_{size}
{
  data_ = std::make_shared<std::vector<uint8_t>>(checked_cell_count(size_), kFree);
}

OccupancyGrid2D::OccupancyGrid2D(int size, const std::vector<uint8_t> & data)
: size_{size}, data_{std::make_shared<std::vector<uint8_t>>(data)}
{
  if (data_->size() != checked_cell_count(size_)) {
    throw std::invalid_argument("Occupancy data does not match grid size.");
  }
}

bool OccupancyGrid2D::in_bounds(const Cell & coords) const
{
  return coords.x >= 0 && coords.x < size_ && coords.y >= 0 && coords.y < size_;
}

std::size_t OccupancyGrid2D::index_of(const Cell & coords) const
{
  if (!in_bounds(coords)) {
    throw std::out_of_range("Coordinates out of grid range.");
  }
  return static_cast<std::size_t>(coords.y) * static_cast<std::size_t>(size_) +
         static_cast<std::size_t>(coords.x);
}

bool OccupancyGrid2D::is_passable(const Cell & coords) const
{
  return data_->at(index_of(coords)) == kFree;
}

void OccupancyGrid2D::set_obstacle(const Cell & coords, bool obstacle)
{
  data_->at(index_of(coords)) = obstacle ? kObstacle : kFree;
}

int OccupancyGrid2D::get_size() const { return size_; }

int OccupancyGrid2D::count_obstacles() const
{
  return static_cast<int>(
    std::count_if(data_->begin(), data_->end(), [](uint8_t v) { return v != kFree; }));
}

std::vector<Cell> OccupancyGrid2D::obstacle_cells() const
{
  std::vector<Cell> cells;
  for (int x = 0; x < size_; x++) {
    for (int y = 0; y < size_; y++) {
      if (!is_passable({x, y})) {
        cells.emplace_back(x, y);
      }
    }
  }
  return cells;
}
