#ifndef SEARCH_NODE_HPP
#define SEARCH_NODE_HPP

#include <optional>
#include <vector>

#include "a_star_heuristics.hpp"
#include "cell_2d.hpp"
#include "occupancy_grid_2d.hpp"

enum class NodeMembership
{
  UNSEEN,
  OPEN,
  CLOSED
};

/**
 * @brief Per-cell bookkeeping for one search.
 *
 * g is empty until the node is first reached, so g.has_value() holds
 * exactly when the node is OPEN or CLOSED.
 */
struct SearchNode
{
  Cell cell;
  std::optional<int> g;     // Cost from start
  int obstacles = 0;        // Obstacle cells on the best known path, self included
  int h = 0;                // Heuristic to the goal, fixed for the run
  std::optional<Cell> parent;
  NodeMembership membership = NodeMembership::UNSEEN;

  int f() const { return g.value_or(0) + h; }
};

/**
 * @brief One SearchNode per grid cell, addressed by cell. Parents are kept
 * as cells, so the arena never holds references between nodes.
 */
class SearchNodeArena
{
public:
  SearchNodeArena(const OccupancyGrid2D & grid, const Cell & goal, const HeuristicFcn & heuristic);

  SearchNode & at(const Cell & cell);

  const SearchNode & at(const Cell & cell) const;

private:
  int size_;
  std::vector<SearchNode> nodes_;
};

#endif  // SEARCH_NODE_HPP
