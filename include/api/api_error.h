#pragma once

#include "core/errors.h"
#include <string>

/**
 * @brief HTTP status and error title for an AttendanceError
 *
 *   InputError          -> 400 "Invalid request"
 *   NotFoundError       -> 404 "Not found"
 *   EmptyResultError    -> 422 "No faces found"
 *   EncodingFailedError -> 422 "Encoding failed"
 *   BackingStoreError   -> 503 "Storage unavailable"
 */
struct ApiError {
    int statusCode = 500;
    std::string error = "Internal server error";

    static ApiError from(const AttendanceError& e);
};
