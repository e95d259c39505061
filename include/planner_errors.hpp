#ifndef PLANNER_ERRORS_HPP
#define PLANNER_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Start or goal rejected before the search starts.
 */
class InvalidInputError : public std::invalid_argument
{
public:
  explicit InvalidInputError(const std::string & what) : std::invalid_argument(what) {}
};

/**
 * @brief The parent links do not lead back to the start. Only a defect in
 * the relaxation logic can cause this.
 */
class InternalInconsistencyError : public std::logic_error
{
public:
  explicit InternalInconsistencyError(const std::string & what) : std::logic_error(what) {}
};

/**
 * @brief Expansion cap exceeded.
 */
class IterationLimitError : public std::runtime_error
{
public:
  explicit IterationLimitError(const std::string & what) : std::runtime_error(what) {}
};

#endif  // PLANNER_ERRORS_HPP
