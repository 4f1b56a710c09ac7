#pragma once

#include <stdexcept>
#include <string>

namespace tables::util {

/*
  Exceptions raised by the allocator services.

  Soft preference violations (table or terrain reuse) never end up here,
  they travel as model::Conflict values. Anything thrown aborts the current
  transaction, and the CLI turns Kind() into its log field and exit code.
*/

class Error : public std::runtime_error {
 public:
  Error(const char* kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  const char* Kind() const noexcept {
    return kind_;
  }

 private:
  const char* kind_;
};

// Unknown tournament, allocation or table.
class NotFound : public Error {
 public:
  explicit NotFound(const std::string& msg) : Error("not_found", msg) {
  }
};

// Caller passed something the allocator refuses: a foreign table, a bye
// edit, a self swap, a table count below the competitor floor.
class InvalidArgument : public Error {
 public:
  explicit InvalidArgument(const std::string& msg) : Error("invalid_argument", msg) {
  }
};

// Persisted state that cannot be read back, e.g. a corrupt audit record.
class InvalidState : public Error {
 public:
  explicit InvalidState(const std::string& msg) : Error("invalid_state", msg) {
  }
};

// Another writer changed the round between our read and our commit.
class TableConflict : public Error {
 public:
  explicit TableConflict(const std::string& msg) : Error("table_conflict", msg) {
  }
};

// A round after the first has more regular pairings than visible tables.
class ResourceExhausted : public Error {
 public:
  explicit ResourceExhausted(const std::string& msg) : Error("resource_exhausted", msg) {
  }
};

} // namespace tables::util
