#ifndef FRONTIER_HPP
#define FRONTIER_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <vector>

#include "cell_2d.hpp"
#include "common.hpp"
#include "search_node.hpp"

/**
 * @brief Priority key of an open node.
 *
 * primary is the obstacle count in RELAXED mode and always 0 in STRICT mode,
 * so the same ordering serves both modes. sequence breaks ties in favour of
 * the entry inserted first.
 */
struct FrontierKey
{
  int primary;
  int f;
  uint64_t sequence;
  Cell cell;

  bool operator<(const FrontierKey & other) const
  {
    if (primary != other.primary) return primary < other.primary;
    if (f != other.f) return f < other.f;
    return sequence < other.sequence;
  }
};

/**
 * @brief Open set of the search. Holds at most one entry per cell; inserting
 * a cell that is already open re-keys it in place.
 */
class Frontier
{
public:
  Frontier(SearchMode mode, int grid_size);

  /**
   * @brief Add the node, or update its key if it is already open. An entry
   * updated while open keeps its place among equal keys.
   *
   * @param node Node whose g, h and obstacle count are current.
   */
  void insert_or_update(const SearchNode & node);

  /**
   * @brief Remove and return the cell with the best key.
   * @throws std::out_of_range if the frontier is empty.
   */
  Cell pop_best();

  bool empty() const;

  bool contains(const Cell & cell) const;

  std::size_t size() const;

private:
  std::size_t slot(const Cell & cell) const;

  SearchMode mode_;
  int grid_size_;
  uint64_t next_sequence_;
  std::set<FrontierKey> open_set_;
  std::vector<std::optional<FrontierKey>> entries_;
};

#endif  // FRONTIER_HPP
