#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace uvk {

struct uvk_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// No interpreter satisfies the selector, even after one install attempt.
struct resolution_error : uvk_error {
  using uvk_error::uvk_error;
};

// Environment creation failed. `cause()` carries the external tool's output.
class provision_error : public uvk_error {
 public:
  provision_error(std::string const &message, std::string cause)
      : uvk_error{ message }, cause_{ std::move(cause) } {}

  std::string const &cause() const { return cause_; }

 private:
  std::string cause_;
};

// The kernel process never reached Running.
struct launch_error : uvk_error {
  using uvk_error::uvk_error;
};

// A dependency mutation failed. The previous environment is still the live one.
// `rolled_back()` is true when a live patch had to be reverted; `environment_consistent()`
// is false only when that revert could not restore the previous package set.
class mutation_error : public uvk_error {
 public:
  mutation_error(std::string const &message,
                 std::string cause,
                 bool rolled_back = false,
                 bool environment_consistent = true)
      : uvk_error{ message },
        cause_{ std::move(cause) },
        rolled_back_{ rolled_back },
        environment_consistent_{ environment_consistent } {}

  std::string const &cause() const { return cause_; }
  bool rolled_back() const { return rolled_back_; }
  bool environment_consistent() const { return environment_consistent_; }

 private:
  std::string cause_;
  bool rolled_back_;
  bool environment_consistent_;
};

// Malformed inline metadata. Returned by the parser as a warning value, not thrown.
struct metadata_error : uvk_error {
  using uvk_error::uvk_error;
};

struct registry_error : uvk_error {
  using uvk_error::uvk_error;
};

struct invalid_specifier_error : uvk_error {
  using uvk_error::uvk_error;
};

// A magic command line that names no known command or uses it in the wrong form.
class magic_error : public uvk_error {
 public:
  magic_error(std::string ename, std::string const &message)
      : uvk_error{ message }, ename_{ std::move(ename) } {}

  std::string const &ename() const { return ename_; }

 private:
  std::string ename_;
};

}  // namespace uvk
