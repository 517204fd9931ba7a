#pragma once
#include <stdexcept>
#include <string>

namespace bw {

// Root of every failure a write can surface. kind() is stable and is what
// travels in server error bodies and the journal.
class BlobWriteError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
  virtual const char* kind() const noexcept = 0;
};

// Path escapes its root or is malformed. Fatal: no fallback is attempted.
class InvalidPathError : public BlobWriteError {
public:
  using BlobWriteError::BlobWriteError;
  const char* kind() const noexcept override { return "invalid_path"; }
};

class AuthError : public BlobWriteError {
public:
  using BlobWriteError::BlobWriteError;
  const char* kind() const noexcept override { return "auth"; }
};

// Parent directory missing and recursive=false.
class DirectoryMissingError : public BlobWriteError {
public:
  using BlobWriteError::BlobWriteError;
  const char* kind() const noexcept override { return "directory_missing"; }
};

class IoError : public BlobWriteError {
public:
  using BlobWriteError::BlobWriteError;
  const char* kind() const noexcept override { return "io"; }
};

class NetworkError : public BlobWriteError {
public:
  using BlobWriteError::BlobWriteError;
  const char* kind() const noexcept override { return "network"; }
};

class TimeoutError : public BlobWriteError {
public:
  using BlobWriteError::BlobWriteError;
  const char* kind() const noexcept override { return "timeout"; }
};

}  // namespace bw
