#ifndef _UL_ERRORS_
#define _UL_ERRORS_

/**
 * Error codes returned by engine operations. Zero means success. -1 keeps its usual meaning
 * of a generic failure, which for this engine is always a storage failure or timeout.
 */
namespace errors
{
    constexpr int PERSISTENCE_ERROR = -1; // Storage unavailable, lock timeout or write failure. Caller may retry.
    constexpr int VALIDATION_ERROR = -2;  // Malformed or out-of-range input.
    constexpr int NOT_FOUND = -3;         // Missing precondition record (eg. no baseline for client).
    constexpr int CONFLICT = -4;          // Duplicate key, second invoice assignment or invalid state change.
    constexpr int UNAUTHORIZED = -5;      // Credential missing or mismatched.

    constexpr const char *to_string(const int code)
    {
        switch (code)
        {
        case 0:
            return "ok";
        case PERSISTENCE_ERROR:
            return "persistence_error";
        case VALIDATION_ERROR:
            return "validation_error";
        case NOT_FOUND:
            return "not_found";
        case CONFLICT:
            return "conflict";
        case UNAUTHORIZED:
            return "unauthorized";
        default:
            return "unknown_error";
        }
    }

} // namespace errors

#endif
