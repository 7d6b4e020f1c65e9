#include "segmentation/types.hpp"

namespace overlapseg {
namespace segmentation {

UtteranceSpan UtteranceSpan::shifted(double offset) const {
    UtteranceSpan moved = *this;
    moved.start = start - offset;
    if (moved.alignment) {
        for (auto& word : *moved.alignment) {
            word.start -= offset;
        }
    }
    return moved;
}

std::string derivedUtteranceId(const std::string& id, size_t scan_position, size_t group_position) {
    return id + "-" + std::to_string(scan_position) + "-" + std::to_string(group_position);
}

} // namespace segmentation
} // namespace overlapseg
