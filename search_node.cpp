#include "search_node.hpp"

#include <stdexcept>

SearchNodeArena::SearchNodeArena(
  const OccupancyGrid2D & grid, const Cell & goal, const HeuristicFcn & heuristic)
: size_{grid.get_size()}
{
  nodes_.resize(static_cast<std::size_t>(size_) * static_cast<std::size_t>(size_));
  for (int x = 0; x < size_; x++) {
    for (int y = 0; y < size_; y++) {
      Cell cell(x, y);
      SearchNode & node = nodes_[grid.index_of(cell)];
      node.cell = cell;
      node.h = heuristic(cell, goal);
    }
  }
}

SearchNode & SearchNodeArena::at(const Cell & cell)
{
  if (cell.x < 0 || cell.x >= size_ || cell.y < 0 || cell.y >= size_) {
    throw std::out_of_range("Search node requested outside the grid.");
  }
  return nodes_[static_cast<std::size_t>(cell.y) * size_ + cell.x];
}

const SearchNode & SearchNodeArena::at(const Cell & cell) const
{
  if (cell.x < 0 || cell.x >= size_ || cell.y < 0 || cell.y >= size_) {
    throw std::out_of_range("Search node requested outside the grid.");
  }
  return nodes_[static_cast<std::size_t>(cell.y) * size_ + cell.x];
}
