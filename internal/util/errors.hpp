#pragma once

#include <stdexcept>
#include <string>

namespace flightrec::util {

/*
  Central error types.

  Lookup failures are NotFound (or one of its narrower kinds), unreadable
  persisted files are Corrupt, filesystem failures are StorageIO and
  precondition violations are InvalidState.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TraceNotFound : public NotFound {
 public:
  explicit TraceNotFound(const std::string& trace_id) : NotFound("trace " + trace_id + " not found") {
  }
};

class SessionNotFound : public NotFound {
 public:
  explicit SessionNotFound(const std::string& session_id) : NotFound("no replay scenario found for session " + session_id) {
  }
};

class RecordNotFound : public NotFound {
 public:
  explicit RecordNotFound(const std::string& record_id) : NotFound("record " + record_id + " not found in session ledger") {
  }
};

class Corrupt : public std::runtime_error {
 public:
  explicit Corrupt(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageIO : public std::runtime_error {
 public:
  explicit StorageIO(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace flightrec::util
