#pragma once

#include <string>

namespace cloudless {

/**
 * Result classification shared by the transfer and room services.
 * Transport failures never appear here: they are absorbed by the presence
 * registry as implicit disconnects.
 */
enum class Outcome {
    OK,
    NOT_FOUND,          // Room, member or transfer absent (or already purged)
    FORBIDDEN,          // Caller is not a member / not the sender / not the creator
    BAD_REQUEST,        // Malformed input: chunk index out of range, wrong mode, bad sizes
    CONFLICT,           // Operation not allowed in the current state
    GONE,               // Expired, or download limit reached
    NOT_READY,          // Download attempted before the upload finished
    STORAGE_FAILURE     // Blob store read/write/delete failed
};

const char* outcome_to_string(Outcome outcome);

/**
 * HTTP status an embedding router should answer with for this outcome.
 */
int outcome_to_http_status(Outcome outcome);

} // namespace cloudless
