#pragma once

#include <stdexcept>
#include <string>

namespace nutrition::util {

/*
  Central error types.

  Scaling errors are local: the caller retries with a corrected amount.
  Codec and reconciler errors abort the whole import/export.
*/

class InvalidAmount : public std::runtime_error {
 public:
  explicit InvalidAmount(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedBackup : public std::runtime_error {
 public:
  explicit MalformedBackup(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsupportedVersion : public std::runtime_error {
 public:
  UnsupportedVersion(const std::string& msg, int version) : std::runtime_error(msg), version_(version) {
  }

  int version() const {
    return version_;
  }

 private:
  int version_;
};

class StorageFailure : public std::runtime_error {
 public:
  explicit StorageFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace nutrition::util
