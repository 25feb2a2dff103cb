// Early-return helpers for absl::Status and absl::StatusOr.

#ifndef STATUS_MACROS_H_
#define STATUS_MACROS_H_

#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#define STATUS_MACROS_CONCAT_INNER_(a, b) a##b
#define STATUS_MACROS_CONCAT_(a, b) STATUS_MACROS_CONCAT_INNER_(a, b)

#define RETURN_IF_ERROR(expr)              \
  do {                                     \
    ::absl::Status status_val_ = (expr);   \
    if (!status_val_.ok()) {               \
      return status_val_;                  \
    }                                      \
  } while (0)

#define ASSIGN_OR_RETURN_IMPL_(status_or, lhs, rhs) \
  auto status_or = (rhs);                           \
  if (!status_or.ok()) return status_or.status();   \
  lhs = std::move(*status_or);

#define ASSIGN_OR_RETURN(lhs, rhs) \
  ASSIGN_OR_RETURN_IMPL_(          \
      STATUS_MACROS_CONCAT_(status_or_, __LINE__), lhs, rhs)

#endif
