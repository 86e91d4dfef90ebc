//
// Created by Giuseppe Francione on 05/12/25.
//

#ifndef PIXTRIM_UPDATE_STATE_HPP
#define PIXTRIM_UPDATE_STATE_HPP

namespace pixtrim {

/**
 * @brief States of the self-update state machine.
 *
 * Idle -> Checking -> Comparing -> Downloading -> Verifying -> Swapping -> Done.
 * Failed is reachable from every state; an up-to-date check ends in Comparing.
 */
enum class UpdateState {
    Idle,
    Checking,
    Comparing,
    Downloading,
    Verifying,
    Swapping,
    Done,
    Failed
};

inline const char* to_string(const UpdateState state) {
    switch (state) {
        case UpdateState::Idle:        return "Idle";
        case UpdateState::Checking:    return "Checking";
        case UpdateState::Comparing:   return "Comparing";
        case UpdateState::Downloading: return "Downloading";
        case UpdateState::Verifying:   return "Verifying";
        case UpdateState::Swapping:    return "Swapping";
        case UpdateState::Done:        return "Done";
        case UpdateState::Failed:      return "Failed";
    }
    return "Unknown";
}

} // namespace pixtrim

#endif // PIXTRIM_UPDATE_STATE_HPP
