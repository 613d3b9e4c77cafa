#include "wkvm_session.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <numeric>

#include <phosphor-logging/log.hpp>

namespace wkvm
{

using namespace phosphor::logging;

Session::Session(boost::asio::io_context& io, const Args& args,
                 TransportFactory factory) :
    io(io), args(args), transportFactory(std::move(factory)),
    quality(args.getQualityLevel(), args.getCompressionLevel()),
    arbitrator(io, record.control, args.getRequestTimeout()),
    input(io, record,
          [this]() -> Transport* {
              return record.connection.isConnected() ? transport.get()
                                                     : nullptr;
          }),
    handshakeTimer(io), reconnectTimer(io), sampleTimer(io), generation(0),
    sampleGeneration(0), attempts(0)
{
    arbitrator.setChangeHandler([this](Actor previous) {
        if (previous == Actor::human && record.control.owner != Actor::human)
        {
            input.releaseHeld();
        }

        notify(Change::control);
    });
}

Session::~Session()
{
    generation++;
    if (transport)
    {
        transport->close();
    }
}

ConnectionState Session::connect()
{
    ConnectionState state = record.connection.state;

    if (state == ConnectionState::connecting ||
        state == ConnectionState::connected)
    {
        return state;
    }

    attempts = 0;
    reconnectTimer.cancel();

    log<level::INFO>("Connecting to workspace",
                     entry("HOST=%s", args.getHost().c_str()),
                     entry("PORT=%d", args.getPort()));

    setState(ConnectionState::connecting);
    openTransport();

    return record.connection.state;
}

void Session::disconnect()
{
    generation++;
    sampleGeneration++;
    handshakeTimer.cancel();
    reconnectTimer.cancel();
    sampleTimer.cancel();

    // release held input while the transport can still carry it
    arbitrator.reset();
    retireTransport();

    if (record.connection.state != ConnectionState::disconnected)
    {
        log<level::INFO>("Disconnected from workspace");
    }
    setState(ConnectionState::disconnected);
}

ControlResult Session::requestControl(Actor actor,
                                      const std::optional<std::string>& reason)
{
    if (!record.connection.isConnected())
    {
        return ControlResult::notConnected;
    }

    return arbitrator.requestControl(actor, reason);
}

ControlResult Session::grantControl(Actor requester, unsigned int seconds)
{
    return arbitrator.grantControl(requester, seconds);
}

ControlResult Session::denyControl()
{
    return arbitrator.denyControl();
}

ControlResult Session::releaseControl(Actor actor)
{
    return arbitrator.releaseControl(actor);
}

ControlResult Session::overrideControl(const std::string& reason)
{
    if (!record.connection.isConnected())
    {
        return ControlResult::notConnected;
    }

    return arbitrator.overrideControl(reason);
}

ControlResult Session::setAutoRelease(unsigned int seconds)
{
    return arbitrator.setAutoRelease(seconds);
}

void Session::improveQuality()
{
    if (quality.improveQuality())
    {
        pushQuality();
    }
}

void Session::improvePerformance()
{
    if (quality.improvePerformance())
    {
        pushQuality();
    }
}

void Session::setQuality(int q, int c)
{
    if (quality.set(q, c))
    {
        pushQuality();
    }
}

bool Session::applyPreset(const std::string& name)
{
    QualitySettings before = quality.getSettings();

    if (!quality.applyPreset(name))
    {
        log<level::ERR>("Unknown quality preset",
                        entry("PRESET=%s", name.c_str()));
        return false;
    }

    if (!(quality.getSettings() == before))
    {
        pushQuality();
    }

    return true;
}

void Session::subscribe(Observer observer)
{
    observers.push_back(std::move(observer));
}

void Session::sampleMetrics()
{
    auto now = std::chrono::steady_clock::now();
    double elapsed =
        std::max(std::chrono::duration<double>(now - lastSample).count(),
                 0.001);
    Transport::Counters counters =
        transport ? transport->getCounters() : Transport::Counters();
    Metrics& metrics = record.connection.metrics;

    // a new transport starts counting from zero
    if (counters.bytesReceived < lastCounters.bytesReceived ||
        counters.framesReceived < lastCounters.framesReceived)
    {
        lastCounters = Transport::Counters();
    }

    uint64_t bytes = counters.bytesReceived - lastCounters.bytesReceived;
    uint64_t frames = counters.framesReceived - lastCounters.framesReceived;

    metrics.totalBytes += bytes;
    metrics.framesReceived += frames;
    metrics.frameRate = frames / elapsed;
    metrics.bandwidthKbps = (bytes * 8.0 / 1000.0) / elapsed;

    if (counters.roundTrip.count() > 0)
    {
        double rtt = counters.roundTrip.count() / 1000.0;

        latencySamples.push_back(rtt);
        if (latencySamples.size() > latencyHistory)
        {
            latencySamples.pop_front();
        }

        if (rtt > highLatencyMs)
        {
            log<level::WARNING>("High workspace latency",
                                entry("LATENCY_MS=%.1f", rtt));
        }
    }

    if (!latencySamples.empty())
    {
        metrics.latencyMs =
            std::accumulate(latencySamples.begin(), latencySamples.end(),
                            0.0) /
            latencySamples.size();
    }

    ConnectionQuality previous = record.connection.quality;

    record.connection.quality = qualityFromLatency(metrics.latencyMs);
    if (record.connection.quality != previous)
    {
        log<level::INFO>("Connection quality changed",
                         entry("QUALITY=%s",
                               toString(record.connection.quality)),
                         entry("LATENCY_MS=%.1f", metrics.latencyMs));
    }

    if (bytes || frames)
    {
        record.connection.lastActivity = Clock::now();
    }

    lastCounters = counters;
    lastSample = now;

    notify(Change::metrics);

    if (args.getAdaptiveQuality() && record.connection.isConnected() &&
        quality.adapt(record.connection.quality))
    {
        pushQuality();
    }
}

void Session::openTransport()
{
    retireTransport();

    uint64_t gen = ++generation;

    transport = transportFactory();

    handshakeTimer.expires_after(args.getConnectTimeout());
    handshakeTimer.async_wait(
        [this, gen](const boost::system::error_code& ec) {
            if (ec || gen != generation)
            {
                return;
            }

            handleHandshake(gen, false, "handshake timed out");
        });

    transport->open(
        args.getCredential(), quality.getSettings(),
        Transport::Handlers{
            [this, gen](bool success, const std::string& reason) {
                handleHandshake(gen, success, reason);
            },
            [this, gen](const std::string& reason) {
                handleClosed(gen, reason);
            }});
}

void Session::handleHandshake(uint64_t gen, bool success,
                              const std::string& reason)
{
    // a timeout may already be queued when the handshake completes
    if (gen != generation || !transport ||
        record.connection.state == ConnectionState::connected)
    {
        return;
    }

    handshakeTimer.cancel();

    if (success)
    {
        attempts = 0;
        resetMetrics();
        transport->applyQuality(quality.getSettings());
        setState(ConnectionState::connected);
        scheduleSample();
        return;
    }

    log<level::ERR>("Workspace handshake failed",
                    entry("REASON=%s", reason.c_str()),
                    entry("ATTEMPT=%d", attempts));
    retireTransport();

    if (record.connection.state == ConnectionState::reconnecting)
    {
        scheduleReconnect();
    }
    else
    {
        setState(ConnectionState::error);
    }
}

void Session::handleClosed(uint64_t gen, const std::string& reason)
{
    if (gen != generation)
    {
        return;
    }

    log<level::WARNING>("Workspace connection lost",
                        entry("REASON=%s", reason.c_str()));

    retireTransport();
    arbitrator.reset();
    setState(ConnectionState::reconnecting);
    scheduleReconnect();
}

void Session::scheduleReconnect()
{
    if (attempts >= args.getMaxRetries())
    {
        log<level::ERR>("Giving up on workspace connection",
                        entry("ATTEMPTS=%d", attempts));
        setState(ConnectionState::error);
        return;
    }

    std::chrono::milliseconds delay = args.getInitialBackoff();

    for (int i = 0; i < attempts && delay < args.getMaxBackoff(); i++)
    {
        delay *= 2;
    }
    delay = std::min(delay, args.getMaxBackoff());

    attempts++;

    uint64_t gen = ++generation;

    log<level::INFO>("Scheduling workspace reconnect",
                     entry("ATTEMPT=%d", attempts),
                     entry("DELAY_MS=%lld", (long long)delay.count()));

    reconnectTimer.expires_after(delay);
    reconnectTimer.async_wait(
        [this, gen](const boost::system::error_code& ec) {
            if (ec || gen != generation)
            {
                return;
            }

            openTransport();
        });
}

void Session::retireTransport()
{
    if (!transport)
    {
        return;
    }

    transport->close();

    // this may run inside one of the transport's own callbacks
    std::shared_ptr<Transport> retired(std::move(transport));
    boost::asio::post(io, [retired]() {});
}

void Session::setState(ConnectionState next)
{
    if (record.connection.state == next)
    {
        return;
    }

    log<level::INFO>("Workspace connection state changed",
                     entry("FROM=%s", toString(record.connection.state)),
                     entry("TO=%s", toString(next)));

    record.connection.state = next;
    record.connection.lastActivity = Clock::now();

    if (next == ConnectionState::disconnected ||
        next == ConnectionState::error)
    {
        sampleGeneration++;
        sampleTimer.cancel();
    }

    notify(Change::state);
}

void Session::resetMetrics()
{
    record.connection.metrics = Metrics();
    record.connection.quality = ConnectionQuality::excellent;
    latencySamples.clear();
    lastCounters = Transport::Counters();
    lastSample = std::chrono::steady_clock::now();
    notify(Change::metrics);
}

void Session::scheduleSample()
{
    uint64_t gen = ++sampleGeneration;

    sampleTimer.expires_after(samplePeriod);
    sampleTimer.async_wait([this, gen](const boost::system::error_code& ec) {
        if (ec || gen != sampleGeneration)
        {
            return;
        }

        sampleMetrics();
        scheduleSample();
    });
}

void Session::pushQuality()
{
    const QualitySettings& settings = quality.getSettings();

    log<level::INFO>("Quality settings changed",
                     entry("QUALITY=%d", settings.qualityLevel),
                     entry("COMPRESSION=%d", settings.compressionLevel));

    if (transport && record.connection.isConnected())
    {
        transport->applyQuality(settings);
    }

    notify(Change::quality);
}

void Session::notify(Change change)
{
    for (const auto& observer : observers)
    {
        observer(change);
    }
}

} // namespace wkvm
