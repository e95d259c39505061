#ifndef DEMO_OPTIONS_HPP
#define DEMO_OPTIONS_HPP

#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include "cell_2d.hpp"
#include "common.hpp"

const int kExitFound = 0;
const int kExitNotFound = 1;
const int kExitBadInput = 2;

/**
 * @brief Settings of the grid_route_demo command line.
 */
struct DemoOptions
{
  SearchMode mode = SearchMode::RELAXED;
  int size = 10;
  Cell start{0, 0};
  std::optional<Cell> goal;
  int obstacles = 20;
  std::optional<unsigned int> seed;
  bool fixed_obstacles = true;
  std::string image_path;
  std::string output_path;
  bool verbose = false;
};

void print_usage(std::ostream & os, const char * prog);

/**
 * @brief Parses "x,y".
 * @throws std::invalid_argument on anything else.
 */
Cell parse_cell(const std::string & text);

int parse_int(const std::string & text);

/**
 * @brief Parses a non-negative integer; a leading '-' is rejected instead
 * of wrapping around.
 */
unsigned int parse_unsigned(const std::string & text);

/**
 * @brief Returns std::nullopt when --help was requested.
 * @throws std::invalid_argument on unknown options or bad values.
 */
std::optional<DemoOptions> parse_args(int argc, const char * const argv[]);

/**
 * @brief Runs body and maps any exception escaping it to kExitBadInput,
 * printing the reason to err.
 */
int run_with_exit_codes(const std::function<int()> & body, std::ostream & err);

#endif  // DEMO_OPTIONS_HPP
