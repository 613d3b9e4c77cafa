#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace wkvm
{

/* @brief Transport status of a workspace session */
enum class ConnectionState
{
    disconnected,
    connecting,
    connected,
    reconnecting,
    error
};

/* @brief Connection quality classification derived from latency */
enum class ConnectionQuality
{
    excellent,
    good,
    poor,
    critical
};

/* @brief Party that may own input control of the remote desktop */
enum class Actor
{
    none,
    human,
    agent
};

/* @brief Outcome of a control arbitration operation */
enum class ControlResult
{
    granted,
    pending,
    alreadyOwned,
    busy,
    reasonRequired,
    noPendingRequest,
    notOwner,
    notConnected,
    denied,
    released,
    updated,
    invalidArgument
};

using Clock = std::chrono::system_clock;

/*
 * @struct Metrics
 * @brief Connection metrics sampled while the transport is up
 */
struct Metrics
{
    /* @brief Average round-trip time in milliseconds */
    double latencyMs = 0;
    /* @brief Framebuffer updates per second in the last window */
    double frameRate = 0;
    /* @brief Downstream kilobits per second in the last window */
    double bandwidthKbps = 0;
    /* @brief Bytes received since the last (re)connect */
    uint64_t totalBytes = 0;
    /* @brief Framebuffer updates received since the last (re)connect */
    uint64_t framesReceived = 0;
};

/*
 * @struct QualitySettings
 * @brief Tunable fidelity/bandwidth pair, lower values mean higher fidelity
 */
struct QualitySettings
{
    int qualityLevel;
    int compressionLevel;

    bool operator==(const QualitySettings&) const = default;
};

/*
 * @struct PendingControlRequest
 * @brief A control transfer waiting to be granted, denied or to time out
 */
struct PendingControlRequest
{
    Actor requestedBy;
    Clock::time_point timestamp;
    std::optional<std::string> reason;
};

/*
 * @struct ConnectionStatus
 * @brief Connection part of the session record, written only by Session
 */
struct ConnectionStatus
{
    ConnectionState state = ConnectionState::disconnected;
    ConnectionQuality quality = ConnectionQuality::excellent;
    Metrics metrics;
    Clock::time_point lastActivity = Clock::now();

    inline bool isConnected() const
    {
        return state == ConnectionState::connected;
    }
};

/*
 * @struct ControlState
 * @brief Control part of the session record, written only by Arbitrator
 */
struct ControlState
{
    Actor owner = Actor::none;
    std::optional<PendingControlRequest> pending;
    /* @brief Seconds left before auto-release, 0 when not armed */
    unsigned int autoReleaseRemaining = 0;
};

/*
 * @struct WorkspaceSession
 * @brief Session record shared read-only with every component
 */
struct WorkspaceSession
{
    ConnectionStatus connection;
    ControlState control;
};

/*
 * @brief Classifies a latency through the connection quality policy
 *
 * @param[in] latencyMs - Round-trip time in milliseconds
 *
 * @return The quality class
 */
ConnectionQuality qualityFromLatency(double latencyMs);

const char* toString(ConnectionState state);
const char* toString(ConnectionQuality quality);
const char* toString(Actor actor);
const char* toString(ControlResult result);

/*
 * @brief Parses an actor name as used on the bus
 *
 * @param[in] name - "none", "human" or "agent"
 *
 * @return The actor, or nothing if the name is unknown
 */
std::optional<Actor> parseActor(const std::string& name);

} // namespace wkvm
