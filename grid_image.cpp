#include "grid_image.hpp"

#include <stdexcept>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

std::shared_ptr<OccupancyGrid2D> load_grid_from_image(const std::string & path, int threshold)
{
  cv::Mat image = cv::imread(path, cv::IMREAD_GRAYSCALE);
  if (image.empty()) {
    throw std::runtime_error("Could not open or find the image at " + path);
  }
  if (image.rows != image.cols) {
    throw std::runtime_error(
      "Grid image must be square, got " + std::to_string(image.cols) + "x" +
      std::to_string(image.rows));
  }

  int size = image.rows;
  std::vector<uint8_t> data(static_cast<std::size_t>(size) * size, OccupancyGrid2D::kFree);
  for (int row = 0; row < size; row++) {
    int y = size - 1 - row;
    for (int x = 0; x < size; x++) {
      if (image.at<uint8_t>(row, x) < threshold) {
        data[static_cast<std::size_t>(y) * size + x] = OccupancyGrid2D::kObstacle;
      }
    }
  }

  return std::make_shared<OccupancyGrid2D>(size, data);
}

cv::Mat render_grid_image(const OccupancyGrid2D & grid, const Route * route, int scale)
{
  int size = grid.get_size();
  cv::Mat image(size * scale, size * scale, CV_8UC3, cv::Scalar(255, 255, 255));

  auto fill = [&](const Cell & cell, const cv::Scalar & color) {
    int row = size - 1 - cell.y;
    cv::rectangle(
      image, cv::Rect(cell.x * scale, row * scale, scale, scale), color, cv::FILLED);
  };

  for (const auto & cell : grid.obstacle_cells()) {
    fill(cell, cv::Scalar(0, 0, 0));
  }

  if (route != nullptr && !route->cells.empty()) {
    for (const auto & cell : route->cells) {
      fill(cell, grid.is_passable(cell) ? cv::Scalar(255, 0, 0) : cv::Scalar(0, 0, 255));
    }
    fill(route->cells.front(), cv::Scalar(0, 255, 0));
  }

  // Cell borders
  for (int i = 0; i <= size; i++) {
    cv::line(image, {i * scale, 0}, {i * scale, size * scale}, cv::Scalar(200, 200, 200));
    cv::line(image, {0, i * scale}, {size * scale, i * scale}, cv::Scalar(200, 200, 200));
  }

  return image;
}

void save_grid_image(const std::string & path, const cv::Mat & image)
{
  if (!cv::imwrite(path, image)) {
    throw std::runtime_error("Could not write image to " + path);
  }
}
