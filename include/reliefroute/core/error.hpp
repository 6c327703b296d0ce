#pragma once

#include <stdexcept>
#include <string>

namespace reliefroute::core {

// Invalid configuration or malformed input. Raised at construction time.
struct ValueError : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// An identifier that must exist was not found.
struct NotFoundError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A zone->center assignment that does not cover every zone exactly once,
// or refers to an unknown center.
struct AssignmentError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace reliefroute::core
