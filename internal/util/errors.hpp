#pragma once

#include <stdexcept>
#include <string>

namespace dedup::util {

/*
  Central error types.

  Storage errors travel as db::Result; these cover contract violations
  raised by the resolution engine and the review workflow.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace dedup::util
