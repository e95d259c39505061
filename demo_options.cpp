#include "demo_options.hpp"

#include <limits>
#include <new>
#include <sstream>
#include <stdexcept>

#include "planner_errors.hpp"

void print_usage(std::ostream & os, const char * prog)
{
  os << "Usage: " << prog << " [options]\n"
     << "  --mode strict|relaxed   obstacle handling (default relaxed)\n"
     << "  --size N                grid side length (default 10)\n"
     << "  --start x,y             start cell (default 0,0)\n"
     << "  --goal x,y              goal cell (default N-1,N-1)\n"
     << "  --obstacles K           random obstacles to place (default 20)\n"
     << "  --seed S                seed for obstacle placement\n"
     << "  --no-fixed-obstacles    skip the scenario obstacles\n"
     << "  --image <path>          load the grid from a grayscale image\n"
     << "  --output <path>         write the rendered route image\n"
     << "  --verbose               print planner progress\n";
}

Cell parse_cell(const std::string & text)
{
  std::istringstream ss(text);
  int x;
  int y;
  char comma;
  if (!(ss >> x >> comma >> y) || comma != ',' || !ss.eof()) {
    throw std::invalid_argument("Expected x,y but got '" + text + "'");
  }
  return Cell(x, y);
}

int parse_int(const std::string & text)
{
  std::size_t used = 0;
  int value;
  try {
    value = std::stoi(text, &used);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("Expected an integer but got '" + text + "'");
  }
  if (used != text.size()) {
    throw std::invalid_argument("Expected an integer but got '" + text + "'");
  }
  return value;
}

unsigned int parse_unsigned(const std::string & text)
{
  if (text.empty() || text[0] == '-' || text[0] == '+') {
    throw std::invalid_argument("Expected a non-negative integer but got '" + text + "'");
  }
  std::size_t used = 0;
  unsigned long value;
  try {
    value = std::stoul(text, &used);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("Expected a non-negative integer but got '" + text + "'");
  }
  if (used != text.size() || value > std::numeric_limits<unsigned int>::max()) {
    throw std::invalid_argument("Expected a non-negative integer but got '" + text + "'");
  }
  return static_cast<unsigned int>(value);
}

std::optional<DemoOptions> parse_args(int argc, const char * const argv[])
{
  DemoOptions opts;
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw std::invalid_argument("Missing value for " + arg);
      }
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      return std::nullopt;
    } else if (arg == "--mode") {
      std::string mode = value();
      if (mode == "strict") {
        opts.mode = SearchMode::STRICT;
      } else if (mode == "relaxed") {
        opts.mode = SearchMode::RELAXED;
      } else {
        throw std::invalid_argument("Unknown mode '" + mode + "'");
      }
    } else if (arg == "--size") {
      opts.size = parse_int(value());
    } else if (arg == "--start") {
      opts.start = parse_cell(value());
    } else if (arg == "--goal") {
      opts.goal = parse_cell(value());
    } else if (arg == "--obstacles") {
      opts.obstacles = parse_int(value());
    } else if (arg == "--seed") {
      opts.seed = parse_unsigned(value());
    } else if (arg == "--no-fixed-obstacles") {
      opts.fixed_obstacles = false;
    } else if (arg == "--image") {
      opts.image_path = value();
    } else if (arg == "--output") {
      opts.output_path = value();
    } else if (arg == "--verbose") {
      opts.verbose = true;
    } else {
      throw std::invalid_argument("Unknown option '" + arg + "'");
    }
  }
  return opts;
}

int run_with_exit_codes(const std::function<int()> & body, std::ostream & err)
{
  try {
    return body();
  } catch (const InvalidInputError & e) {
    err << "Invalid input: " << e.what() << std::endl;
  } catch (const std::invalid_argument & e) {
    err << "Error: " << e.what() << std::endl;
  } catch (const std::bad_alloc & e) {
    err << "Error: out of memory (" << e.what() << ")" << std::endl;
  } catch (const InternalInconsistencyError & e) {
    err << "Internal error: " << e.what() << std::endl;
  } catch (const std::exception & e) {
    err << "Error: " << e.what() << std::endl;
  }
  return kExitBadInput;
}
