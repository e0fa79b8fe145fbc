#include "upkit/session.hpp"

namespace upkit {

std::string stateName(UpdateState state) {
    switch (state) {
        case UpdateState::IDLE: return "Idle";
        case UpdateState::CHECKING: return "Checking";
        case UpdateState::UPDATE_AVAILABLE: return "UpdateAvailable";
        case UpdateState::DOWNLOADING: return "Downloading";
        case UpdateState::VERIFIED: return "Verified";
        case UpdateState::INSTALLING: return "Installing";
        case UpdateState::RESTART_PENDING: return "RestartPending";
        case UpdateState::FAILED: return "Failed";
        case UpdateState::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

bool isTransitionAllowed(UpdateState from, UpdateState to) {
    using S = UpdateState;
    switch (from) {
        case S::IDLE:
        case S::FAILED:
        case S::CANCELLED:
            return to == S::CHECKING;
        case S::CHECKING:
            return to == S::IDLE || to == S::UPDATE_AVAILABLE ||
                   to == S::FAILED || to == S::CANCELLED;
        case S::UPDATE_AVAILABLE:
            return to == S::DOWNLOADING || to == S::IDLE || to == S::FAILED;
        case S::DOWNLOADING:
            return to == S::VERIFIED || to == S::FAILED || to == S::CANCELLED;
        case S::VERIFIED:
            return to == S::INSTALLING || to == S::IDLE || to == S::FAILED;
        case S::INSTALLING:
            // Not cancellable once the installation is being replaced.
            return to == S::RESTART_PENDING || to == S::FAILED;
        case S::RESTART_PENDING:
            return to == S::IDLE || to == S::FAILED;
    }
    return false;
}

bool UpdateSession::isActive() const {
    return !isTerminal();
}

bool UpdateSession::isTerminal() const {
    return state == UpdateState::IDLE || state == UpdateState::FAILED ||
           state == UpdateState::CANCELLED;
}

} // namespace upkit
