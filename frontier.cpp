#include "frontier.hpp"

#include <stdexcept>

Frontier::Frontier(SearchMode mode, int grid_size)
: mode_{mode},
  grid_size_{grid_size},
  next_sequence_{0},
  entries_(static_cast<std::size_t>(grid_size) * static_cast<std::size_t>(grid_size))
{
}

std::size_t Frontier::slot(const Cell & cell) const
{
  if (cell.x < 0 || cell.x >= grid_size_ || cell.y < 0 || cell.y >= grid_size_) {
    throw std::out_of_range("Frontier cell outside the grid.");
  }
  return static_cast<std::size_t>(cell.y) * grid_size_ + cell.x;
}

void Frontier::insert_or_update(const SearchNode & node)
{
  auto & entry = entries_.at(slot(node.cell));

  FrontierKey key;
  key.primary = (mode_ == SearchMode::RELAXED) ? node.obstacles : 0;
  key.f = node.f();
  key.cell = node.cell;

  if (entry.has_value()) {
    key.sequence = entry->sequence;
    open_set_.erase(*entry);
  } else {
    key.sequence = next_sequence_++;
  }

  open_set_.insert(key);
  entry = key;
}

Cell Frontier::pop_best()
{
  if (open_set_.empty()) {
    throw std::out_of_range("pop_best called on an empty frontier.");
  }
  auto best = open_set_.begin();
  Cell cell = best->cell;
  open_set_.erase(best);
  entries_.at(slot(cell)).reset();
  return cell;
}

bool Frontier::empty() const { return open_set_.empty(); }

bool Frontier::contains(const Cell & cell) const { return entries_.at(slot(cell)).has_value(); }

std::size_t Frontier::size() const { return open_set_.size(); }
