#pragma once

/// @file game_error.hpp
/// @brief Error type carried by GameResult<T>.

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "ctc/foundation/error_code.hpp"
#include "ctc/foundation/types.hpp"

namespace ctc::foundation {

/// Error code, readable message and, when the failure concerns a single
/// actor, that actor's id.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, ActorId actor)
        : code_(code), message_(std::move(message)), actor_(actor) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Actor the failure relates to, if any.
    [[nodiscard]] std::optional<ActorId> actor() const noexcept { return actor_; }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::optional<ActorId> actor_;
};

} // namespace ctc::foundation