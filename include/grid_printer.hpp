#ifndef GRID_PRINTER_HPP
#define GRID_PRINTER_HPP

#include <ostream>
#include <string>
#include <vector>

#include "cell_2d.hpp"
#include "common.hpp"
#include "occupancy_grid_2d.hpp"
#include "route.hpp"

const char kEmptySymbol = ' ';
const char kObstacleSymbol = 'X';
const char kPathSymbol = 'O';
const char kTraversedSymbol = '+';

/**
 * @brief Prints the grid with y = size - 1 on the first line. Route cells
 * are drawn as O, or + where the route crosses an obstacle.
 */
void print_grid(std::ostream & os, const OccupancyGrid2D & grid, const Route * route = nullptr);

/**
 * @brief Formats cells as [(x,y),(x,y)].
 */
std::string format_cells(const std::vector<Cell> & cells);

void print_route_summary(std::ostream & os, const Route & route, SearchMode mode);

#endif  // GRID_PRINTER_HPP
