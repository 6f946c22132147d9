#pragma once

#include <feedbacker/models.h>

#include <stdexcept>
#include <string>

namespace feedbacker {

class JobError : public std::runtime_error {
public:
  JobError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }
  JobErrorInfo info() const { return JobErrorInfo{kind_, what()}; }

private:
  ErrorKind kind_;
};

} // namespace feedbacker
