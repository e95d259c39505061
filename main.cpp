#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "a_star_2d_grid_planner.hpp"
#include "demo_options.hpp"
#include "grid_image.hpp"
#include "grid_printer.hpp"
#include "obstacle_placement.hpp"

namespace
{

// Delivery scenario obstacles, applied on top of the random ones.
const std::vector<Cell> kFixedObstacles = {{9, 7}, {8, 7}, {6, 7}, {6, 8}};

std::shared_ptr<OccupancyGrid2D> build_grid(const DemoOptions & opts, const Cell & goal)
{
  if (!opts.image_path.empty()) {
    return load_grid_from_image(opts.image_path);
  }

  auto grid = std::make_shared<OccupancyGrid2D>(opts.size);

  if (opts.fixed_obstacles) {
    std::vector<Cell> fixed;
    for (const auto & cell : kFixedObstacles) {
      if (grid->in_bounds(cell) && cell != opts.start && cell != goal) {
        fixed.push_back(cell);
      }
    }
    place_obstacles(*grid, fixed);
    std::cout << "Obstacles were placed at " << format_cells(fixed) << "\n";
  }

  std::mt19937 rng(opts.seed.has_value() ? *opts.seed : std::random_device{}());
  if (grid->in_bounds(opts.start) && grid->in_bounds(goal)) {
    auto placed = place_random_obstacles(*grid, opts.obstacles, opts.start, goal, rng);
    std::cout << "Random obstacles were placed at:\n" << format_cells(placed) << "\n\n";
  }

  return grid;
}

int run_demo(const DemoOptions & opts)
{
  std::shared_ptr<OccupancyGrid2D> grid;
  Cell goal;
  if (!opts.image_path.empty()) {
    grid = build_grid(opts, Cell());
    goal = opts.goal.value_or(Cell(grid->get_size() - 1, grid->get_size() - 1));
  } else {
    goal = opts.goal.value_or(Cell(opts.size - 1, opts.size - 1));
    grid = build_grid(opts, goal);
  }

  AStar2DGridPlanner planner(grid, opts.mode);
  planner.set_verbose(opts.verbose);

  auto search_start = std::chrono::high_resolution_clock::now();
  SearchResult result = planner.find_route(opts.start, goal);
  auto search_stop = std::chrono::high_resolution_clock::now();
  auto duration =
    std::chrono::duration_cast<std::chrono::microseconds>(search_stop - search_start);
  std::cout << "A* (" << to_string(opts.mode) << ") " << to_string(result.state) << " in "
            << duration.count() << " microseconds and " << result.expansions << " expansions."
            << std::endl;

  if (!result.found()) {
    print_grid(std::cout, *grid);
    std::cout << "\nCould not find a path from start to destination." << std::endl;
    return kExitNotFound;
  }

  const Route & route = *result.route;
  print_grid(std::cout, *grid, &route);
  std::cout << "\n";
  print_route_summary(std::cout, route, opts.mode);

  if (!opts.output_path.empty()) {
    save_grid_image(opts.output_path, render_grid_image(*grid, &route));
    std::cout << "Route image written to " << opts.output_path << std::endl;
  }
  return kExitFound;
}

}  // namespace

int main(int argc, char ** argv)
{
  std::optional<DemoOptions> parsed;
  try {
    parsed = parse_args(argc, argv);
  } catch (const std::exception & e) {
    std::cerr << "Error: " << e.what() << std::endl;
    print_usage(std::cerr, argv[0]);
    return kExitBadInput;
  }
  if (!parsed) {
    print_usage(std::cout, argv[0]);
    return kExitFound;
  }
  const DemoOptions opts = *parsed;

  return run_with_exit_codes([&opts]() { return run_demo(opts); }, std::cerr);
}
