#include "wkvm_arbitrator.hpp"

#include <phosphor-logging/log.hpp>

namespace wkvm
{

using namespace phosphor::logging;

Arbitrator::Arbitrator(boost::asio::io_context& io, ControlState& s,
                       std::chrono::seconds timeout) :
    state(s), requestTimeout(timeout), tickTimer(io), requestTimer(io),
    tickGeneration(0), requestGeneration(0)
{}

ControlResult Arbitrator::requestControl(
    Actor actor, const std::optional<std::string>& reason)
{
    if (actor == Actor::none)
    {
        return ControlResult::invalidArgument;
    }

    if (state.owner == actor)
    {
        return ControlResult::alreadyOwned;
    }

    if (state.pending)
    {
        // the owner released while this actor was waiting
        if (state.owner == Actor::none && state.pending->requestedBy == actor)
        {
            return grantControl(actor);
        }

        return ControlResult::busy;
    }

    if (state.owner == Actor::none)
    {
        setOwner(actor);
        log<level::INFO>("Control granted", entry("OWNER=%s", toString(actor)));
        notify(Actor::none);
        return ControlResult::granted;
    }

    bool hasReason = reason && !reason->empty();

    if (actor == Actor::human && state.owner == Actor::agent && !hasReason)
    {
        return ControlResult::reasonRequired;
    }

    state.pending = PendingControlRequest{
        actor, Clock::now(), hasReason ? reason : std::nullopt};
    scheduleRequestTimeout();

    log<level::INFO>("Control requested",
                     entry("REQUESTER=%s", toString(actor)),
                     entry("OWNER=%s", toString(state.owner)),
                     entry("REASON=%s", hasReason ? reason->c_str() : ""));
    notify(state.owner);
    return ControlResult::pending;
}

ControlResult Arbitrator::grantControl(Actor requester, unsigned int seconds)
{
    if (!state.pending || state.pending->requestedBy != requester)
    {
        return ControlResult::noPendingRequest;
    }

    if (seconds && requester != Actor::human)
    {
        return ControlResult::invalidArgument;
    }

    Actor previous = state.owner;

    state.pending.reset();
    requestGeneration++;
    requestTimer.cancel();

    setOwner(requester);
    if (seconds)
    {
        state.autoReleaseRemaining = seconds;
        scheduleTick();
    }

    log<level::INFO>("Control granted", entry("OWNER=%s", toString(requester)),
                     entry("PREVIOUS=%s", toString(previous)),
                     entry("AUTO_RELEASE=%u", seconds));
    notify(previous);
    return ControlResult::granted;
}

ControlResult Arbitrator::denyControl()
{
    if (!state.pending)
    {
        return ControlResult::noPendingRequest;
    }

    log<level::INFO>("Control request denied",
                     entry("REQUESTER=%s",
                           toString(state.pending->requestedBy)));

    state.pending.reset();
    requestGeneration++;
    requestTimer.cancel();

    notify(state.owner);
    return ControlResult::denied;
}

ControlResult Arbitrator::releaseControl(Actor actor)
{
    if (actor == Actor::none || state.owner != actor)
    {
        return ControlResult::notOwner;
    }

    setOwner(Actor::none);
    log<level::INFO>("Control released", entry("OWNER=%s", toString(actor)));
    notify(actor);
    return ControlResult::released;
}

ControlResult Arbitrator::overrideControl(const std::string& reason)
{
    if (reason.empty())
    {
        return ControlResult::reasonRequired;
    }

    if (state.owner == Actor::human)
    {
        return ControlResult::alreadyOwned;
    }

    Actor previous = state.owner;

    state.pending.reset();
    requestGeneration++;
    requestTimer.cancel();

    setOwner(Actor::human);
    log<level::WARNING>("Control taken over",
                        entry("PREVIOUS=%s", toString(previous)),
                        entry("REASON=%s", reason.c_str()));
    notify(previous);
    return ControlResult::granted;
}

ControlResult Arbitrator::setAutoRelease(unsigned int seconds)
{
    if (state.owner != Actor::human)
    {
        return ControlResult::notOwner;
    }

    tickGeneration++;
    tickTimer.cancel();
    state.autoReleaseRemaining = seconds;
    if (seconds)
    {
        scheduleTick();
    }

    notify(state.owner);
    return ControlResult::updated;
}

void Arbitrator::tick()
{
    if (state.owner != Actor::human || !state.autoReleaseRemaining)
    {
        return;
    }

    if (--state.autoReleaseRemaining)
    {
        notify(state.owner);
        return;
    }

    setOwner(Actor::none);
    log<level::INFO>("Control auto-released");
    notify(Actor::human);
}

void Arbitrator::reset()
{
    Actor previous = state.owner;
    bool changed = previous != Actor::none || state.pending ||
                   state.autoReleaseRemaining;

    state.pending.reset();
    requestGeneration++;
    requestTimer.cancel();
    setOwner(Actor::none);

    if (changed)
    {
        notify(previous);
    }
}

void Arbitrator::setOwner(Actor next)
{
    tickGeneration++;
    tickTimer.cancel();
    state.autoReleaseRemaining = 0;
    state.owner = next;
}

void Arbitrator::scheduleTick()
{
    uint64_t generation = tickGeneration;

    tickTimer.expires_after(tickPeriod);
    tickTimer.async_wait(
        [this, generation](const boost::system::error_code& ec) {
            if (ec || generation != tickGeneration)
            {
                return;
            }

            tick();
            if (state.autoReleaseRemaining)
            {
                scheduleTick();
            }
        });
}

void Arbitrator::scheduleRequestTimeout()
{
    uint64_t generation = ++requestGeneration;

    requestTimer.expires_after(requestTimeout);
    requestTimer.async_wait(
        [this, generation](const boost::system::error_code& ec) {
            if (ec || generation != requestGeneration || !state.pending)
            {
                return;
            }

            log<level::INFO>("Control request timed out",
                             entry("REQUESTER=%s",
                                   toString(state.pending->requestedBy)));
            state.pending.reset();
            notify(state.owner);
        });
}

void Arbitrator::notify(Actor previous)
{
    if (changeHandler)
    {
        changeHandler(previous);
    }
}

} // namespace wkvm
