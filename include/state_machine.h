#pragma once

#include <memory>
#include <string>

namespace parley {

/**
 * @brief Turn state enumeration
 */
enum class TurnState {
    Idle,               ///< No turn running
    ProbingWithTools,   ///< Non-streaming call offering the selected tool schemas
    ProbingNoTools,     ///< Tool-free probe after a capability downgrade
    ExecutingTools,     ///< Running the tool calls of the last probe
    Streaming,          ///< Streaming the final answer
    Done,
    Failed,
    Cancelled
};

const char* turn_state_name(TurnState state);

bool is_terminal(TurnState state);

/**
 * @brief State machine for one coordinator turn
 *
 * - Idle -> ProbingWithTools (new user message)
 * - ProbingWithTools -> ExecutingTools (tool calls returned)
 * - ProbingWithTools -> ProbingNoTools (provider rejected tools; once per turn)
 * - ProbingWithTools | ProbingNoTools -> Streaming (plain content)
 * - ExecutingTools -> ProbingWithTools (results appended)
 * - Streaming -> Done (end of stream)
 * - any non-terminal -> Failed | Cancelled
 *
 * Illegal transitions are refused and leave the state unchanged.
 */
class TurnStateMachine {
public:
    TurnStateMachine();
    ~TurnStateMachine();

    TurnState get_state() const;

    /**
     * @brief Move to a new state
     * @return false if the transition is not legal from the current state
     */
    bool transition(TurnState next);

    /**
     * @brief Take the single-fire downgrade transition
     * @return false if the turn already downgraded or is not probing with tools
     */
    bool downgrade();

    bool downgraded() const;

    /// Completed probe/tool rounds in this turn
    int rounds() const;

    /// Called after each tool execution phase
    void count_round();

    /**
     * @brief Reset to Idle for the next turn
     */
    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace parley
