#ifndef A_STAR_2D_GRID_PLANNER_HPP
#define A_STAR_2D_GRID_PLANNER_HPP

#include <memory>
#include <optional>

#include "a_star_heuristics.hpp"
#include "cell_2d.hpp"
#include "common.hpp"
#include "frontier.hpp"
#include "occupancy_grid_2d.hpp"
#include "route.hpp"
#include "search_node.hpp"

/**
 * @brief Outcome of one search. route is set exactly when state is
 * GOAL_REACHED; EXHAUSTED means no route exists.
 */
struct SearchResult
{
  SearchState state = SearchState::RUNNING;
  std::optional<Route> route;
  long long expansions = 0;
  long long reopened = 0;  // Closed nodes put back on the open set

  bool found() const { return state == SearchState::GOAL_REACHED; }
};

/**
 * @brief 8-connected A* over an OccupancyGrid2D with unit step cost.
 *
 * In RELAXED mode the open set is ordered by (obstacles crossed, f) and a
 * closed node is re-opened whenever a path with a better (obstacles, g) pair
 * reaches it. Closed nodes are therefore never skipped.
 */
class AStar2DGridPlanner
{
public:
  static constexpr int kDefaultExpansionLimitFactor = 8;

  AStar2DGridPlanner(
    const std::shared_ptr<OccupancyGrid2D> & grid_ptr, SearchMode mode = SearchMode::STRICT,
    HeuristicFcn heuristic = chebyshev_distance);

  /**
   * @brief Searches for a route from start to goal.
   *
   * @param start Cell in which the route should start.
   * @param goal Cell in which the route should terminate.
   * @return SearchResult GOAL_REACHED with the route, or EXHAUSTED.
   * @throws InvalidInputError for out-of-bounds cells, or an obstacle start
   * or goal in STRICT mode.
   * @throws IterationLimitError if the expansion cap is reached.
   */
  SearchResult find_route(const Cell & start, const Cell & goal) const;

  void set_mode(SearchMode mode);

  void set_heuristic(HeuristicFcn heuristic);

  /**
   * @brief Cap the search at size * size * factor expansions.
   */
  void set_expansion_limit_factor(int factor);

  void set_verbose(bool verbose);

  SearchMode get_mode() const;

private:
  void validate(const Cell & start, const Cell & goal) const;

  std::shared_ptr<OccupancyGrid2D> grid_ptr_;
  SearchMode mode_;
  HeuristicFcn heuristic_;
  int expansion_limit_factor_;
  bool verbose_;
};

/**
 * @brief One-shot search with the Chebyshev heuristic.
 */
SearchResult search(
  const std::shared_ptr<OccupancyGrid2D> & grid_ptr, const Cell & start, const Cell & goal,
  SearchMode mode);

#endif  // A_STAR_2D_GRID_PLANNER_HPP
