#pragma once

#include "wkvm_arbitrator.hpp"
#include "wkvm_args.hpp"
#include "wkvm_input.hpp"
#include "wkvm_quality.hpp"
#include "wkvm_transport.hpp"
#include "wkvm_types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wkvm
{

/*
 * @class Session
 * @brief Owns the connection lifecycle of one workspace and the session
 *        record every other component reads
 */
class Session
{
  public:
    /* @brief Part of the session record that changed */
    enum class Change
    {
        state,
        control,
        metrics,
        quality
    };

    using Observer = std::function<void(Change change)>;
    /* @brief Creates a fresh transport for every connection attempt */
    using TransportFactory = std::function<std::unique_ptr<Transport>()>;

    /* @brief Period of the metrics sampler */
    static constexpr std::chrono::seconds samplePeriod{1};
    /* @brief Number of round-trip samples averaged into the latency */
    static constexpr size_t latencyHistory = 100;
    /* @brief Round trip above which a warning is logged */
    static constexpr double highLatencyMs = 500.0;

    /*
     * @brief Constructs Session object
     *
     * @param[in] io      - Event queue every component runs on
     * @param[in] args    - Reference to Args object
     * @param[in] factory - Transport factory
     */
    Session(boost::asio::io_context& io, const Args& args,
            TransportFactory factory);
    ~Session();
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    /*
     * @brief Starts a connection attempt
     *
     * Does nothing while connecting or connected. From reconnecting or
     * error it resets the retry counter and tries at once.
     *
     * @return The state after the call
     */
    ConnectionState connect();
    /* @brief Closes the transport and releases control */
    void disconnect();

    ControlResult requestControl(Actor actor,
                                 const std::optional<std::string>& reason =
                                     std::nullopt);
    ControlResult grantControl(Actor requester, unsigned int seconds = 0);
    ControlResult denyControl();
    ControlResult releaseControl(Actor actor);
    ControlResult overrideControl(const std::string& reason);
    ControlResult setAutoRelease(unsigned int seconds);

    void improveQuality();
    void improvePerformance();
    void setQuality(int q, int c);
    /* @return False if the preset is unknown */
    bool applyPreset(const std::string& name);

    /* @brief Registers an observer of record changes */
    void subscribe(Observer observer);

    /*
     * @brief Takes one metrics sample from the transport counters; runs
     *        every sample period while a transport exists
     */
    void sampleMetrics();

    inline const WorkspaceSession& getRecord() const
    {
        return record;
    }

    inline ConnectionState getState() const
    {
        return record.connection.state;
    }

    inline const QualitySettings& getQualitySettings() const
    {
        return quality.getSettings();
    }

    inline Input& getInput()
    {
        return input;
    }

    /* @brief Reconnect attempts made since the last success */
    inline int getAttempts() const
    {
        return attempts;
    }

  private:
    /* @brief Creates a transport and starts its handshake */
    void openTransport();
    void handleHandshake(uint64_t gen, bool success,
                         const std::string& reason);
    void handleClosed(uint64_t gen, const std::string& reason);
    /* @brief Schedules the next attempt or gives up */
    void scheduleReconnect();
    /* @brief Closes the transport and destroys it once the stack unwinds */
    void retireTransport();
    void setState(ConnectionState next);
    void resetMetrics();
    void scheduleSample();
    /* @brief Pushes the current settings to a connected transport */
    void pushQuality();
    void notify(Change change);

    /* @brief Session event queue */
    boost::asio::io_context& io;
    /* @brief Copy of the configuration */
    Args args;
    TransportFactory transportFactory;
    /* @brief The session record */
    WorkspaceSession record;
    Quality quality;
    Arbitrator arbitrator;
    Input input;
    std::unique_ptr<Transport> transport;
    /* @brief Bounds the handshake of every attempt */
    boost::asio::steady_timer handshakeTimer;
    /* @brief Waits out the backoff between attempts */
    boost::asio::steady_timer reconnectTimer;
    /* @brief Drives the metrics sampler */
    boost::asio::steady_timer sampleTimer;
    /* @brief Invalidates callbacks of earlier attempts */
    uint64_t generation;
    uint64_t sampleGeneration;
    int attempts;
    /* @brief Round-trip samples in milliseconds, newest last */
    std::deque<double> latencySamples;
    /* @brief Counters seen by the previous sample */
    Transport::Counters lastCounters;
    std::chrono::steady_clock::time_point lastSample;
    std::vector<Observer> observers;
};

} // namespace wkvm
