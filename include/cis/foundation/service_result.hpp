#pragma once

/// @file service_result.hpp
/// @brief ServiceResult<T> type alias for identity service error handling.

#include "cis/core/result.hpp"
#include "cis/foundation/service_error.hpp"

namespace cis::foundation {

/// Result type specialized with ServiceError.
///
/// Every adapter and identity component method that can fail returns
/// ServiceResult<T> instead of throwing exceptions.
///
/// Example:
/// @code
///   ServiceResult<int> parseWorkers(int64_t raw) {
///       if (raw < 1 || raw > 20) {
///           return ServiceResult<int>::err(
///               ServiceError(ErrorCode::InvalidArgument, "out of range"));
///       }
///       return ServiceResult<int>::ok(static_cast<int>(raw));
///   }
/// @endcode
template <typename T>
using ServiceResult = cis::Result<T, ServiceError>;

}  // namespace cis::foundation
