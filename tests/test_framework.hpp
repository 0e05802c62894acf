#pragma once

#include "semcache/common/result.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace semcache::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

// Thrown by the require helpers; the runner reports what() as the failure.
class TestFailure : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

inline void require(const bool condition, const std::string &message) {
  if (!condition) {
    throw TestFailure(message);
  }
}

// Fails with the carried error text, prefixed by `context`.
template <typename R> void require_ok(const R &result, const std::string &context) {
  if (!result.ok()) {
    throw TestFailure(context + ": [" + std::string(common::error_code_name(result.code())) +
                      "] " + result.error());
  }
}

template <typename R>
void require_code(const R &result, const common::ErrorCode expected, const std::string &context) {
  if (result.ok()) {
    throw TestFailure(context + ": expected " + std::string(common::error_code_name(expected)) +
                      ", got success");
  }
  if (result.code() != expected) {
    throw TestFailure(context + ": expected " + std::string(common::error_code_name(expected)) +
                      ", got " + std::string(common::error_code_name(result.code())) + " (" +
                      result.error() + ")");
  }
}

} // namespace semcache::tests
