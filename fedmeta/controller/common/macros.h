#ifndef FEDMETA_FEDMETA_CONTROLLER_COMMON_MACROS_H_
#define FEDMETA_FEDMETA_CONTROLLER_COMMON_MACROS_H_

#include <string>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

#define VALIDATE(value)                                            \
  do {                                                             \
    if (value == false) {                                          \
      throw std::runtime_error("Unable to load proto from text."); \
    }                                                              \
  } while (0)

// Run a command that returns a util::Status.  If the called code returns an
// error status, return that status up out of this method too.
//
// Example:
//   RETURN_IF_ERROR(DoThings(4));
#define RETURN_IF_ERROR(expr)                                                \
  do {                                                                       \
    /* Using _status below to avoid capture problems if expr is "status". */ \
    ::absl::Status _status = (expr);                                         \
    if (ABSL_PREDICT_FALSE(!_status.ok())) return _status;                   \
  } while (0)

#define FEDMETA_STATUS_MACROS_CONCAT_INNER(x, y) x##y
#define FEDMETA_STATUS_MACROS_CONCAT(x, y) \
  FEDMETA_STATUS_MACROS_CONCAT_INNER(x, y)

#define FEDMETA_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                  \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                 \
    return statusor.status();                               \
  }                                                         \
  lhs = std::move(statusor).value()

// Evaluate an expression that returns an absl::StatusOr<T>. On error return
// the status, otherwise move the value into lhs.
//
// Example:
//   ASSIGN_OR_RETURN(auto dataset, source->Load());
#define ASSIGN_OR_RETURN(lhs, rexpr)                                        \
  FEDMETA_ASSIGN_OR_RETURN_IMPL(                                            \
      FEDMETA_STATUS_MACROS_CONCAT(_status_or_value, __LINE__), lhs, rexpr)

#endif  // FEDMETA_FEDMETA_CONTROLLER_COMMON_MACROS_H_
