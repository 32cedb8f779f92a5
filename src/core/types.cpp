#include "facewatch/core/types.hpp"
#include <chrono>
#include <stdexcept>

namespace facewatch {

const char* to_string(ReviewState state) {
    switch (state) {
        case ReviewState::Unreviewed: return "unreviewed";
        case ReviewState::Dismissed:  return "dismissed";
        case ReviewState::Enrolled:   return "enrolled";
        case ReviewState::Deleted:    return "deleted";
    }
    return "unknown";
}

ReviewState review_state_from_string(const std::string& name) {
    if (name == "unreviewed") return ReviewState::Unreviewed;
    if (name == "dismissed")  return ReviewState::Dismissed;
    if (name == "enrolled")   return ReviewState::Enrolled;
    if (name == "deleted")    return ReviewState::Deleted;
    throw std::invalid_argument("Unknown review state: " + name);
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace facewatch
