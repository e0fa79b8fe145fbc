#ifndef UPKIT_SESSION_HPP
#define UPKIT_SESSION_HPP

#include "upkit/errors.hpp"
#include "upkit/feed_client.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace upkit {

enum class UpdateState {
    IDLE,
    CHECKING,
    UPDATE_AVAILABLE,
    DOWNLOADING,
    VERIFIED,
    INSTALLING,
    RESTART_PENDING,
    FAILED,
    CANCELLED
};

std::string stateName(UpdateState state);

// The single table every state change is checked against.
bool isTransitionAllowed(UpdateState from, UpdateState to);

struct SessionError {
    ErrorKind kind;
    std::string message;
};

// One check-through-install cycle. Only the orchestrator writes it; everyone
// else sees copies.
struct UpdateSession {
    std::uint64_t id = 0;
    UpdateState state = UpdateState::IDLE;
    std::optional<ReleaseCandidate> candidate;
    std::optional<std::filesystem::path> stagedArtifactPath;
    std::optional<SessionError> error;
    float progressFraction = 0.0f;

    // A new check may start only when this is false.
    bool isActive() const;
    bool isTerminal() const;
};

} // namespace upkit

#endif // UPKIT_SESSION_HPP
