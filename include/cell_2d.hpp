#ifndef CELL_2D_HPP
#define CELL_2D_HPP

#include <iostream>

struct Cell
{
  Cell() : x{0}, y{0} {}

  Cell(int x, int y)
  {
    this->x = x;
    this->y = y;
  }

  bool operator==(const Cell & other) const { return (other.x == x) && (other.y == y); }

  bool operator!=(const Cell & other) const { return !(other == *this); }

  bool operator<(const Cell & other) const
  {
    return (x < other.x) || ((x == other.x) && (y < other.y));
  }

  friend std::ostream & operator<<(std::ostream & os, const Cell & obj)
  {
    os << "(" << obj.x << "," << obj.y << ")";
    return os;
  }

  int x;
  int y;
};

#endif // CELL_2D_HPP
