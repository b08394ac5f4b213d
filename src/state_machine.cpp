#include "state_machine.h"

namespace parley {

const char* turn_state_name(TurnState state) {
    switch (state) {
        case TurnState::Idle: return "IDLE";
        case TurnState::ProbingWithTools: return "PROBING_WITH_TOOLS";
        case TurnState::ProbingNoTools: return "PROBING_NO_TOOLS";
        case TurnState::ExecutingTools: return "EXECUTING_TOOLS";
        case TurnState::Streaming: return "STREAMING";
        case TurnState::Done: return "DONE";
        case TurnState::Failed: return "FAILED";
        case TurnState::Cancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

bool is_terminal(TurnState state) {
    return state == TurnState::Done || state == TurnState::Failed || state == TurnState::Cancelled;
}

class TurnStateMachine::Impl {
public:
    Impl() : state_(TurnState::Idle), downgraded_(false), rounds_(0) {}

    TurnState get_state() const {
        return state_;
    }

    bool transition(TurnState next) {
        if (!is_legal(next)) {
            return false;
        }
        state_ = next;
        return true;
    }

    bool downgrade() {
        if (downgraded_ || state_ != TurnState::ProbingWithTools) {
            return false;
        }
        downgraded_ = true;
        state_ = TurnState::ProbingNoTools;
        return true;
    }

    bool downgraded() const {
        return downgraded_;
    }

    int rounds() const {
        return rounds_;
    }

    void count_round() {
        rounds_++;
    }

    void reset() {
        state_ = TurnState::Idle;
        downgraded_ = false;
        rounds_ = 0;
    }

private:
    bool is_legal(TurnState next) const {
        if (is_terminal(state_)) {
            return false;
        }
        if (next == TurnState::Failed || next == TurnState::Cancelled) {
            return true;
        }

        switch (state_) {
            case TurnState::Idle:
                return next == TurnState::ProbingWithTools;

            case TurnState::ProbingWithTools:
                // ProbingNoTools only through downgrade()
                return next == TurnState::ExecutingTools || next == TurnState::Streaming;

            case TurnState::ProbingNoTools:
                return next == TurnState::Streaming;

            case TurnState::ExecutingTools:
                return next == TurnState::ProbingWithTools;

            case TurnState::Streaming:
                return next == TurnState::Done;

            default:
                return false;
        }
    }

    TurnState state_;
    bool downgraded_;
    int rounds_;
};

TurnStateMachine::TurnStateMachine() : pimpl_(std::make_unique<Impl>()) {}

TurnStateMachine::~TurnStateMachine() = default;

TurnState TurnStateMachine::get_state() const {
    return pimpl_->get_state();
}

bool TurnStateMachine::transition(TurnState next) {
    return pimpl_->transition(next);
}

bool TurnStateMachine::downgrade() {
    return pimpl_->downgrade();
}

bool TurnStateMachine::downgraded() const {
    return pimpl_->downgraded();
}

int TurnStateMachine::rounds() const {
    return pimpl_->rounds();
}

void TurnStateMachine::count_round() {
    pimpl_->count_round();
}

void TurnStateMachine::reset() {
    pimpl_->reset();
}

} // namespace parley
