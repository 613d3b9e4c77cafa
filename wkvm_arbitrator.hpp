#pragma once

#include "wkvm_types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace wkvm
{

/*
 * @class Arbitrator
 * @brief Decides which actor owns input control of the workspace
 *
 * The arbitrator is the only writer of the control part of the session
 * record. Every operation runs to completion on the session's io_context,
 * so callers never observe an intermediate state.
 */
class Arbitrator
{
  public:
    /*
     * @brief Called after every committed change of the control state
     *
     * @param[in] previous - Owner before the change
     */
    using ChangeHandler = std::function<void(Actor previous)>;

    /* @brief Period of the auto-release countdown */
    static constexpr std::chrono::seconds tickPeriod{1};

    /*
     * @brief Constructs Arbitrator object
     *
     * @param[in] io      - Session event queue for the timers
     * @param[in] s       - Control part of the session record
     * @param[in] timeout - Lifetime of a pending request
     */
    Arbitrator(boost::asio::io_context& io, ControlState& s,
               std::chrono::seconds timeout);
    ~Arbitrator() = default;
    Arbitrator(const Arbitrator&) = delete;
    Arbitrator& operator=(const Arbitrator&) = delete;
    Arbitrator(Arbitrator&&) = delete;
    Arbitrator& operator=(Arbitrator&&) = delete;

    inline const ControlState& getState() const
    {
        return state;
    }

    /* @brief Registers the change handler */
    inline void setChangeHandler(ChangeHandler handler)
    {
        changeHandler = std::move(handler);
    }

    /*
     * @brief Asks for input control
     *
     * Grants at once when nobody owns control. When the other actor owns
     * it, records a pending request instead; taking control away from the
     * agent requires a reason.
     *
     * @param[in] actor  - Requesting actor
     * @param[in] reason - Why control is wanted
     *
     * @return granted, pending, alreadyOwned, busy, reasonRequired or
     *         invalidArgument
     */
    ControlResult requestControl(Actor actor,
                                 const std::optional<std::string>& reason =
                                     std::nullopt);
    /*
     * @brief Grants the pending request
     *
     * @param[in] requester - Actor the pending request must come from
     * @param[in] seconds   - Auto-release countdown, 0 for none; human only
     *
     * @return granted, noPendingRequest or invalidArgument
     */
    ControlResult grantControl(Actor requester, unsigned int seconds = 0);
    /* @brief Discards the pending request */
    ControlResult denyControl();
    /*
     * @brief Gives up control
     *
     * @param[in] actor - Must be the current owner
     *
     * @return released or notOwner
     */
    ControlResult releaseControl(Actor actor);
    /*
     * @brief Human takeover from the agent without a request step
     *
     * @param[in] reason - Mandatory justification
     */
    ControlResult overrideControl(const std::string& reason);
    /*
     * @brief Arms or cancels the auto-release countdown of a human owner
     *
     * @param[in] seconds - Countdown length, 0 cancels it
     */
    ControlResult setAutoRelease(unsigned int seconds);
    /* @brief One countdown step; releases control when it reaches zero */
    void tick();
    /*
     * @brief System release on disconnect or connection loss: no owner, no
     *        pending request, no timers
     */
    void reset();

  private:
    /* @brief Commits a new owner and cancels the countdown */
    void setOwner(Actor next);
    /* @brief Schedules the next countdown step */
    void scheduleTick();
    /* @brief Arms the expiry of the pending request */
    void scheduleRequestTimeout();
    /* @brief Notifies the change handler */
    void notify(Actor previous);

    /* @brief Control part of the session record */
    ControlState& state;
    /* @brief Lifetime of a pending request */
    std::chrono::seconds requestTimeout;
    /* @brief Drives the auto-release countdown */
    boost::asio::steady_timer tickTimer;
    /* @brief Expires the pending request */
    boost::asio::steady_timer requestTimer;
    /* @brief Invalidates countdown steps queued before a cancel */
    uint64_t tickGeneration;
    /* @brief Invalidates request expiries queued before a cancel */
    uint64_t requestGeneration;
    ChangeHandler changeHandler;
};

} // namespace wkvm
