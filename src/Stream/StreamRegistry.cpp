#include "StreamRegistry.hpp"

const char* toString(UpdateOutcome outcome) {
    switch (outcome) {
        case UpdateOutcome::UPDATED:
            return "updated";
        case UpdateOutcome::NOT_UPDATED:
            return "not updated";
        case UpdateOutcome::UNKNOWN_KEY:
            return "unknown key";
    }
    return "invalid";
}
