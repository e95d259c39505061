#include "grid_printer.hpp"

#include <sstream>

void print_grid(std::ostream & os, const OccupancyGrid2D & grid, const Route * route)
{
  int size = grid.get_size();
  std::vector<char> symbols(static_cast<std::size_t>(size) * size, kEmptySymbol);

  for (const auto & cell : grid.obstacle_cells()) {
    symbols[grid.index_of(cell)] = kObstacleSymbol;
  }
  if (route != nullptr) {
    for (const auto & cell : route->cells) {
      symbols[grid.index_of(cell)] = grid.is_passable(cell) ? kPathSymbol : kTraversedSymbol;
    }
  }

  for (int y = size - 1; y >= 0; y--) {
    for (int x = 0; x < size; x++) {
      os << '[' << symbols[grid.index_of({x, y})] << "] ";
    }
    os << '\n';
  }
}

std::string format_cells(const std::vector<Cell> & cells)
{
  std::ostringstream ss;
  ss << "[";
  for (std::size_t i = 0; i < cells.size(); i++) {
    if (i > 0) {
      ss << ",";
    }
    ss << cells[i];
  }
  ss << "]";
  return ss.str();
}

void print_route_summary(std::ostream & os, const Route & route, SearchMode mode)
{
  if (mode == SearchMode::RELAXED && route.obstacles_crossed > 0) {
    os << "Unable to reach delivery point without crossing obstacles\n\n";
  }
  os << "This is a path from the start to the destination traversing " << route.obstacles_crossed
     << " obstacle(s)\n\n";
  os << format_cells(route.cells) << "\n\n";
  os << "This is " << route.steps() << " steps\n";
  if (route.obstacles_crossed > 0) {
    os << "\nObstacles were traversed at:\n" << format_cells(route.obstacle_cells) << "\n";
  }
}
