#ifndef A_STAR_HEURISTICS_HPP
#define A_STAR_HEURISTICS_HPP

#include <algorithm>
#include <cstdlib>
#include <functional>

#include "cell_2d.hpp"

using HeuristicFcn = std::function<int(const Cell &, const Cell &)>;

/**
 * @brief Number of king moves between two cells. Admissible and consistent
 * when diagonal and straight steps both cost 1.
 */
inline int chebyshev_distance(const Cell & p1, const Cell & p2)
{
  return std::max(std::abs(p2.x - p1.x), std::abs(p2.y - p1.y));
}

inline int zero_distance(const Cell & p1, const Cell & p2)
{
  (void)p1;
  (void)p2;
  return 0;
}

#endif  // A_STAR_HEURISTICS_HPP
