#include "a_star_2d_grid_planner.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "planner_errors.hpp"

AStar2DGridPlanner::AStar2DGridPlanner(
  const std::shared_ptr<OccupancyGrid2D> & grid_ptr, SearchMode mode, HeuristicFcn heuristic)
{
  grid_ptr_ = grid_ptr;
  mode_ = mode;
  heuristic_ = heuristic;
  expansion_limit_factor_ = kDefaultExpansionLimitFactor;
  verbose_ = false;
}

void AStar2DGridPlanner::validate(const Cell & start, const Cell & goal) const
{
  if (grid_ptr_ == nullptr) {
    throw InvalidInputError("Grid not provided.");
  }

  std::ostringstream msg;
  if (!grid_ptr_->in_bounds(start)) {
    msg << "Start " << start << " is outside the " << grid_ptr_->get_size() << "x"
        << grid_ptr_->get_size() << " grid.";
    throw InvalidInputError(msg.str());
  }
  if (!grid_ptr_->in_bounds(goal)) {
    msg << "Goal " << goal << " is outside the " << grid_ptr_->get_size() << "x"
        << grid_ptr_->get_size() << " grid.";
    throw InvalidInputError(msg.str());
  }
  if (mode_ == SearchMode::STRICT) {
    if (!grid_ptr_->is_passable(start)) {
      msg << "Start " << start << " is an obstacle.";
      throw InvalidInputError(msg.str());
    }
    if (!grid_ptr_->is_passable(goal)) {
      msg << "Goal " << goal << " is an obstacle.";
      throw InvalidInputError(msg.str());
    }
  }
}

SearchResult AStar2DGridPlanner::find_route(const Cell & start, const Cell & goal) const
{
  validate(start, goal);

  const OccupancyGrid2D & grid = *grid_ptr_;
  const int size = grid.get_size();
  const bool relaxed = (mode_ == SearchMode::RELAXED);

  SearchNodeArena nodes(grid, goal, heuristic_);
  Frontier open_set(mode_, size);
  SearchResult result;

  SearchNode & start_node = nodes.at(start);
  start_node.g = 0;
  start_node.obstacles = grid.is_passable(start) ? 0 : 1;
  start_node.membership = NodeMembership::OPEN;

  if (start == goal) {
    result.state = SearchState::GOAL_REACHED;
    result.route = reconstruct_route(nodes, grid, start, goal);
    return result;
  }

  open_set.insert_or_update(start_node);

  const long long max_expansions = static_cast<long long>(size) * size * expansion_limit_factor_;
  result.state = SearchState::RUNNING;

  while (!open_set.empty() && result.state == SearchState::RUNNING) {
    Cell cell = open_set.pop_best();
    SearchNode & curr = nodes.at(cell);
    curr.membership = NodeMembership::CLOSED;

    if (++result.expansions > max_expansions) {
      std::ostringstream msg;
      msg << "Search exceeded " << max_expansions << " expansions on a " << size << "x" << size
          << " grid.";
      throw IterationLimitError(msg.str());
    }

    for (const auto & offset : kEightConnectedOffsets) {
      Cell neighbor_cell(cell.x + offset.x, cell.y + offset.y);
      if (!grid.in_bounds(neighbor_cell)) {
        continue;
      }

      bool neighbor_passable = grid.is_passable(neighbor_cell);
      if (!relaxed && !neighbor_passable) {
        continue;
      }

      SearchNode & neighbor = nodes.at(neighbor_cell);
      int new_g = *curr.g + 1;
      int new_obstacles = curr.obstacles + (neighbor_passable ? 0 : 1);

      if (neighbor_cell == goal) {
        neighbor.g = new_g;
        neighbor.obstacles = new_obstacles;
        neighbor.parent = cell;
        neighbor.membership = NodeMembership::CLOSED;
        result.state = SearchState::GOAL_REACHED;
        break;
      }

      /* Closed nodes stay eligible: under the (obstacles, g) key a later path
       * can beat the one a node was closed with. */
      bool improves = false;
      if (neighbor.membership == NodeMembership::UNSEEN) {
        improves = true;
      } else if (relaxed && new_obstacles < neighbor.obstacles) {
        improves = true;
      } else if (new_obstacles == neighbor.obstacles && new_g < *neighbor.g) {
        improves = true;
      }

      if (improves) {
        if (neighbor.membership == NodeMembership::CLOSED) {
          result.reopened++;
        }
        neighbor.g = new_g;
        neighbor.obstacles = new_obstacles;
        neighbor.parent = cell;
        neighbor.membership = NodeMembership::OPEN;
        open_set.insert_or_update(neighbor);
      }
    }
  }

  if (result.state != SearchState::GOAL_REACHED) {
    result.state = SearchState::EXHAUSTED;
    if (verbose_) {
      std::cout << "No " << to_string(mode_) << " route from " << start << " to " << goal
                << ", search " << to_string(result.state) << " after " << result.expansions
                << " expansions." << std::endl;
    }
    return result;
  }

  if (verbose_) {
    std::cout << "Found goal!" << std::endl;
    std::cout << "Planned in " << result.expansions << " expansions (" << result.reopened
              << " reopened)." << std::endl;
  }

  result.route = reconstruct_route(nodes, grid, start, goal);
  return result;
}

void AStar2DGridPlanner::set_mode(SearchMode mode) { mode_ = mode; }

void AStar2DGridPlanner::set_heuristic(HeuristicFcn heuristic) { heuristic_ = heuristic; }

void AStar2DGridPlanner::set_expansion_limit_factor(int factor)
{
  if (factor <= 0) {
    throw std::invalid_argument(
      "Expansion limit factor must be positive, got " + std::to_string(factor));
  }
  expansion_limit_factor_ = factor;
}

void AStar2DGridPlanner::set_verbose(bool verbose) { verbose_ = verbose; }

SearchMode AStar2DGridPlanner::get_mode() const { return mode_; }

SearchResult search(
  const std::shared_ptr<OccupancyGrid2D> & grid_ptr, const Cell & start, const Cell & goal,
  SearchMode mode)
{
  AStar2DGridPlanner planner(grid_ptr, mode);
  return planner.find_route(start, goal);
}
