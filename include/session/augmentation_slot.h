#pragma once

#include <cstdint>

namespace voxlink {

/**
 * @brief Single in-flight augmentation, DROP policy
 *
 * A claim while occupied is rejected; the caller discards that utterance.
 * The slot remembers the session generation it was claimed under so a
 * completion from an older session cannot release a newer claim.
 */
class AugmentationSlot {
public:
    bool try_claim(uint64_t generation) {
        if (occupied_) return false;
        occupied_ = true;
        generation_ = generation;
        return true;
    }

    /// Release only if held under `generation`
    bool release(uint64_t generation) {
        if (!occupied_ || generation != generation_) return false;
        occupied_ = false;
        return true;
    }

    void reset() { occupied_ = false; }

    bool occupied() const { return occupied_; }
    uint64_t generation() const { return generation_; }

private:
    bool occupied_ = false;
    uint64_t generation_ = 0;
};

} // namespace voxlink
