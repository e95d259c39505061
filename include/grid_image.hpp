#ifndef GRID_IMAGE_HPP
#define GRID_IMAGE_HPP

#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include "occupancy_grid_2d.hpp"
#include "route.hpp"

/**
 * @brief Loads a square grayscale image as a grid. Pixels darker than
 * threshold become obstacles. Image row 0 is the top row, y = size - 1.
 *
 * @throws std::runtime_error if the image cannot be read or is not square.
 */
std::shared_ptr<OccupancyGrid2D> load_grid_from_image(const std::string & path, int threshold = 128);

/**
 * @brief Draws the grid and an optional route, scale pixels per cell.
 */
cv::Mat render_grid_image(const OccupancyGrid2D & grid, const Route * route, int scale = 20);

void save_grid_image(const std::string & path, const cv::Mat & image);

#endif  // GRID_IMAGE_HPP
