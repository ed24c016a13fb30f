#include "outcome.h"

namespace cloudless {

const char* outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::OK:              return "ok";
        case Outcome::NOT_FOUND:       return "not_found";
        case Outcome::FORBIDDEN:       return "forbidden";
        case Outcome::BAD_REQUEST:     return "bad_request";
        case Outcome::CONFLICT:        return "conflict";
        case Outcome::GONE:            return "gone";
        case Outcome::NOT_READY:       return "not_ready";
        case Outcome::STORAGE_FAILURE: return "storage_failure";
    }
    return "unknown";
}

int outcome_to_http_status(Outcome outcome) {
    switch (outcome) {
        case Outcome::OK:              return 200;
        case Outcome::NOT_FOUND:       return 404;
        case Outcome::FORBIDDEN:       return 403;
        case Outcome::BAD_REQUEST:     return 400;
        case Outcome::CONFLICT:        return 409;
        case Outcome::GONE:            return 410;
        case Outcome::NOT_READY:       return 400;
        case Outcome::STORAGE_FAILURE: return 500;
    }
    return 500;
}

} // namespace cloudless
