#include "wkvm_types.hpp"

#include <array>
#include <utility>

namespace wkvm
{

// Upper latency bound (exclusive) of each class; anything above is critical
static constexpr std::array<std::pair<double, ConnectionQuality>, 3>
    qualityThresholds = {{{100.0, ConnectionQuality::excellent},
                          {300.0, ConnectionQuality::good},
                          {800.0, ConnectionQuality::poor}}};

ConnectionQuality qualityFromLatency(double latencyMs)
{
    for (const auto& [bound, quality] : qualityThresholds)
    {
        if (latencyMs < bound)
        {
            return quality;
        }
    }

    return ConnectionQuality::critical;
}

const char* toString(ConnectionState state)
{
    switch (state)
    {
        case ConnectionState::disconnected:
            return "disconnected";
        case ConnectionState::connecting:
            return "connecting";
        case ConnectionState::connected:
            return "connected";
        case ConnectionState::reconnecting:
            return "reconnecting";
        case ConnectionState::error:
            return "error";
    }

    return "unknown";
}

const char* toString(ConnectionQuality quality)
{
    switch (quality)
    {
        case ConnectionQuality::excellent:
            return "excellent";
        case ConnectionQuality::good:
            return "good";
        case ConnectionQuality::poor:
            return "poor";
        case ConnectionQuality::critical:
            return "critical";
    }

    return "unknown";
}

const char* toString(Actor actor)
{
    switch (actor)
    {
        case Actor::none:
            return "none";
        case Actor::human:
            return "human";
        case Actor::agent:
            return "agent";
    }

    return "unknown";
}

const char* toString(ControlResult result)
{
    switch (result)
    {
        case ControlResult::granted:
            return "granted";
        case ControlResult::pending:
            return "pending";
        case ControlResult::alreadyOwned:
            return "already owned";
        case ControlResult::busy:
            return "another request is pending";
        case ControlResult::reasonRequired:
            return "a reason is required to take control from the agent";
        case ControlResult::noPendingRequest:
            return "no pending request from this actor";
        case ControlResult::notOwner:
            return "caller does not own control";
        case ControlResult::notConnected:
            return "workspace is not connected";
        case ControlResult::denied:
            return "denied";
        case ControlResult::released:
            return "released";
        case ControlResult::updated:
            return "updated";
        case ControlResult::invalidArgument:
            return "invalid argument";
    }

    return "unknown";
}

std::optional<Actor> parseActor(const std::string& name)
{
    if (name == "none")
    {
        return Actor::none;
    }
    if (name == "human")
    {
        return Actor::human;
    }
    if (name == "agent")
    {
        return Actor::agent;
    }

    return std::nullopt;
}

} // namespace wkvm
