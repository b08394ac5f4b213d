#pragma once

#include <string>
#include <functional>

namespace parley {

/**
 * @brief What the user is asked to approve
 */
struct ConfirmationRequest {
    std::string tool_name;
    std::string arguments;    ///< JSON
    std::string preview;      ///< Human-readable summary of the effect
};

struct ConfirmationDecision {
    bool accepted = false;
    std::string confirmed_by;  ///< Who approved (user name, "auto", ...)

    static ConfirmationDecision accept(const std::string& who) { return {true, who}; }
    static ConfirmationDecision reject() { return {false, ""}; }
};

/**
 * @brief UI boundary that approves WRITE tool calls
 *
 * Called on the coordinator worker thread and may block while the user
 * decides; it must not touch another session's state.
 */
class ConfirmationHandler {
public:
    virtual ~ConfirmationHandler() = default;

    virtual ConfirmationDecision confirm(const ConfirmationRequest& request) = 0;
};

/**
 * @brief Confirmation backed by a callable (terminal prompt, tests)
 */
class CallbackConfirmation : public ConfirmationHandler {
public:
    using Callback = std::function<ConfirmationDecision(const ConfirmationRequest&)>;

    explicit CallbackConfirmation(Callback callback) : callback_(std::move(callback)) {}

    ConfirmationDecision confirm(const ConfirmationRequest& request) override {
        return callback_ ? callback_(request) : ConfirmationDecision::reject();
    }

private:
    Callback callback_;
};

} // namespace parley
