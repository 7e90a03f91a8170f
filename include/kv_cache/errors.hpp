#pragma once

#include <stdexcept>
#include <string>

namespace kv_cache {

// Caller mistakes. These always propagate out of the cache.
class InvalidArgumentError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class TooManyParentKeysError : public InvalidArgumentError {
public:
  using InvalidArgumentError::InvalidArgumentError;
};

class NotSerializableError : public InvalidArgumentError {
public:
  using InvalidArgumentError::InvalidArgumentError;
};

class NotSupportedError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// Environmental failures. The cache records and logs them, callers see a
// miss or a no-op.
class StoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class DecodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class OperationCanceledError : public std::runtime_error {
public:
  OperationCanceledError() : std::runtime_error("operation canceled") {}
};

} // namespace kv_cache
