#include "wkvm_manager.hpp"

#include "wkvm_rfb_transport.hpp"

#include <signal.h>

#include <phosphor-logging/elog-errors.hpp>
#include <phosphor-logging/elog.hpp>
#include <phosphor-logging/log.hpp>
#include <xyz/openbmc_project/Common/error.hpp>

namespace wkvm
{

using namespace phosphor::logging;
using namespace sdbusplus::xyz::openbmc_project::Common::Error;
using Argument = xyz::openbmc_project::Common::InvalidArgument;

Manager::Manager(const Args& args) :
    args(args),
    session(io, args,
            [this]() -> std::unique_ptr<Transport> {
                return std::make_unique<RfbTransport>(
                    io, this->args.getHost(), this->args.getPort(),
                    this->args.getConnectTimeout());
            }),
    signals(io, SIGINT, SIGTERM)
{
    session.subscribe([this](Session::Change change) { publish(change); });
}

void Manager::attach(std::shared_ptr<sdbusplus::asio::dbus_interface> iface)
{
    const WorkspaceSession& record = session.getRecord();
    const Metrics& metrics = record.connection.metrics;
    const QualitySettings& settings = session.getQualitySettings();

    interface = iface;

    interface->register_property(
        "ConnectionState", std::string(toString(record.connection.state)));
    interface->register_property(
        "ConnectionQuality",
        std::string(toString(record.connection.quality)));
    interface->register_property("ControlOwner",
                                 std::string(toString(record.control.owner)));
    interface->register_property("PendingRequester", std::string(""));
    interface->register_property("PendingReason", std::string(""));
    interface->register_property("AutoReleaseRemaining",
                                 record.control.autoReleaseRemaining);
    interface->register_property("LatencyMs", metrics.latencyMs);
    interface->register_property("FrameRate", metrics.frameRate);
    interface->register_property("BandwidthKbps", metrics.bandwidthKbps);
    interface->register_property("QualityLevel",
                                 int32_t(settings.qualityLevel));
    interface->register_property("CompressionLevel",
                                 int32_t(settings.compressionLevel));

    interface->register_method("Connect", [this]() {
        return std::string(toString(session.connect()));
    });
    interface->register_method("Disconnect",
                               [this]() { session.disconnect(); });

    interface->register_method(
        "RequestControl",
        [this](const std::string& actor, const std::string& reason) {
            std::optional<std::string> why;

            if (!reason.empty())
            {
                why = reason;
            }

            return std::string(
                toString(session.requestControl(toActor(actor), why)));
        });
    interface->register_method(
        "GrantControl", [this](const std::string& actor, uint32_t seconds) {
            return std::string(
                toString(session.grantControl(toActor(actor), seconds)));
        });
    interface->register_method("DenyControl", [this]() {
        return std::string(toString(session.denyControl()));
    });
    interface->register_method(
        "ReleaseControl", [this](const std::string& actor) {
            return std::string(
                toString(session.releaseControl(toActor(actor))));
        });
    interface->register_method(
        "OverrideControl", [this](const std::string& reason) {
            return std::string(toString(session.overrideControl(reason)));
        });
    interface->register_method("SetAutoRelease", [this](uint32_t seconds) {
        return std::string(toString(session.setAutoRelease(seconds)));
    });

    interface->register_method("ImproveQuality",
                               [this]() { session.improveQuality(); });
    interface->register_method("ImprovePerformance",
                               [this]() { session.improvePerformance(); });
    interface->register_method("SetQuality", [this](int32_t q, int32_t c) {
        session.setQuality(q, c);
    });
    interface->register_method("ApplyPreset", [this](const std::string& name) {
        return session.applyPreset(name);
    });

    interface->register_method("MovePointer", [this](int32_t x, int32_t y) {
        session.getInput().pointerMove(x, y);
    });
    interface->register_method(
        "PointerButton",
        [this](const std::string& button, bool down, int32_t x, int32_t y) {
            session.getInput().pointerButton(toButton(button), down, x, y);
        });
    interface->register_method(
        "Scroll", [this](const std::string& direction, int32_t x, int32_t y) {
            session.getInput().scroll(toDirection(direction), x, y);
        });
    interface->register_method(
        "Key", [this](const std::string& key, bool down, uint8_t modifiers) {
            session.getInput().keyEvent(key, down, modifiers);
        });
    interface->register_method("Clipboard", [this](const std::string& text) {
        session.getInput().sendClipboard(text);
    });
    interface->register_method(
        "Touch", [this](const std::string& phase, int32_t id, int32_t x,
                        int32_t y) {
            Input& input = session.getInput();

            if (phase == "start")
            {
                input.touchStart(id, x, y);
            }
            else if (phase == "move")
            {
                input.touchMove(id, x, y);
            }
            else if (phase == "end")
            {
                input.touchEnd(id, x, y);
            }
            else if (phase == "cancel")
            {
                input.touchCancel();
            }
            else
            {
                log<level::ERR>("Unknown touch phase",
                                entry("PHASE=%s", phase.c_str()));
                elog<InvalidArgument>(Argument::ARGUMENT_NAME("phase"),
                                      Argument::ARGUMENT_VALUE(phase.c_str()));
            }
        });
}

void Manager::run()
{
    signals.async_wait([this](const boost::system::error_code& ec, int sig) {
        if (ec)
        {
            return;
        }

        log<level::INFO>("Stopping on signal", entry("SIGNAL=%d", sig));
        session.disconnect();
        io.stop();
    });

    if (args.getConnectOnStart())
    {
        session.connect();
    }

    io.run();
}

void Manager::publish(Session::Change change)
{
    if (!interface)
    {
        return;
    }

    const WorkspaceSession& record = session.getRecord();

    switch (change)
    {
        case Session::Change::state:
            interface->set_property(
                "ConnectionState",
                std::string(toString(record.connection.state)));
            break;
        case Session::Change::control:
        {
            const auto& pending = record.control.pending;

            interface->set_property(
                "ControlOwner", std::string(toString(record.control.owner)));
            interface->set_property(
                "PendingRequester",
                std::string(pending ? toString(pending->requestedBy) : ""));
            interface->set_property(
                "PendingReason",
                pending && pending->reason ? *pending->reason
                                           : std::string(""));
            interface->set_property("AutoReleaseRemaining",
                                    record.control.autoReleaseRemaining);
            break;
        }
        case Session::Change::metrics:
        {
            const Metrics& metrics = record.connection.metrics;

            interface->set_property(
                "ConnectionQuality",
                std::string(toString(record.connection.quality)));
            interface->set_property("LatencyMs", metrics.latencyMs);
            interface->set_property("FrameRate", metrics.frameRate);
            interface->set_property("BandwidthKbps", metrics.bandwidthKbps);
            break;
        }
        case Session::Change::quality:
        {
            const QualitySettings& settings = session.getQualitySettings();

            interface->set_property("QualityLevel",
                                    int32_t(settings.qualityLevel));
            interface->set_property("CompressionLevel",
                                    int32_t(settings.compressionLevel));
            break;
        }
    }
}

Actor Manager::toActor(const std::string& name)
{
    auto actor = parseActor(name);

    if (!actor)
    {
        log<level::ERR>("Unknown actor", entry("ACTOR=%s", name.c_str()));
        elog<InvalidArgument>(Argument::ARGUMENT_NAME("actor"),
                              Argument::ARGUMENT_VALUE(name.c_str()));
    }

    return *actor;
}

Input::Button Manager::toButton(const std::string& name)
{
    if (name == "left")
    {
        return Input::Button::left;
    }
    if (name == "middle")
    {
        return Input::Button::middle;
    }
    if (name == "right")
    {
        return Input::Button::right;
    }

    log<level::ERR>("Unknown pointer button",
                    entry("BUTTON=%s", name.c_str()));
    elog<InvalidArgument>(Argument::ARGUMENT_NAME("button"),
                          Argument::ARGUMENT_VALUE(name.c_str()));
}

Input::ScrollDirection Manager::toDirection(const std::string& name)
{
    if (name == "up")
    {
        return Input::ScrollDirection::up;
    }
    if (name == "down")
    {
        return Input::ScrollDirection::down;
    }
    if (name == "left")
    {
        return Input::ScrollDirection::left;
    }
    if (name == "right")
    {
        return Input::ScrollDirection::right;
    }

    log<level::ERR>("Unknown scroll direction",
                    entry("DIRECTION=%s", name.c_str()));
    elog<InvalidArgument>(Argument::ARGUMENT_NAME("direction"),
                          Argument::ARGUMENT_VALUE(name.c_str()));
}

} // namespace wkvm
