#include "api/api_error.h"

ApiError ApiError::from(const AttendanceError& e) {
    if (dynamic_cast<const InputError*>(&e)) {
        return {400, "Invalid request"};
    }
    if (dynamic_cast<const NotFoundError*>(&e)) {
        return {404, "Not found"};
    }
    if (dynamic_cast<const EmptyResultError*>(&e)) {
        return {422, "No faces found"};
    }
    if (dynamic_cast<const EncodingFailedError*>(&e)) {
        return {422, "Encoding failed"};
    }
    if (dynamic_cast<const BackingStoreError*>(&e)) {
        return {503, "Storage unavailable"};
    }
    return {};
}
