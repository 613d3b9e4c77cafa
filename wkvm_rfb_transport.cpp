#include "wkvm_rfb_transport.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/socket.h>

#include <boost/asio/post.hpp>
#include <phosphor-logging/log.hpp>

#include <thread>

namespace wkvm
{

using namespace phosphor::logging;

/* @brief Client data tags, only their addresses matter */
static int handshakeTag;
static int transportTag;

static constexpr int bitsPerSample = 8;
static constexpr int samplesPerPixel = 3;
static constexpr int bytesPerPixel = 4;

static void logClientInfo(const char* format, ...)
{
    char message[512];
    va_list args;

    va_start(args, format);
    vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    log<level::DEBUG>("libvncclient", entry("MESSAGE=%s", message));
}

static void logClientError(const char* format, ...)
{
    char message[512];
    va_list args;

    va_start(args, format);
    vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    log<level::ERR>("libvncclient error", entry("MESSAGE=%s", message));
}

RfbTransport::Handshake::~Handshake()
{
    if (client)
    {
        rfbClientCleanup(client);
    }
}

RfbTransport::RfbTransport(boost::asio::io_context& io, const std::string& h,
                           int p, std::chrono::seconds timeout) :
    io(io), host(h), port(p), connectTimeout(timeout), client(nullptr),
    socket(io), quality{6, 2}, lifetime(std::make_shared<int>(0))
{
    static std::once_flag redirectLog;

    std::call_once(redirectLog, []() {
        rfbClientLog = logClientInfo;
        rfbClientErr = logClientError;
    });
}

RfbTransport::~RfbTransport()
{
    close();
}

void RfbTransport::open(const std::string& credential,
                        const QualitySettings& q, Handlers h)
{
    close();

    handlers = std::move(h);
    quality = q;
    counters = Counters();
    lifetime = std::make_shared<int>(0);

    handshake = std::make_shared<Handshake>();
    handshake->io = &io;
    handshake->owner = this;
    handshake->credential = credential;
    handshake->client =
        rfbGetClient(bitsPerSample, samplesPerPixel, bytesPerPixel);

    if (!handshake->client)
    {
        log<level::ERR>("Failed to allocate RFB client");
        handshake.reset();

        std::weak_ptr<int> guard = lifetime;
        boost::asio::post(io, [this, guard]() {
            auto done = handlers.handshake;

            if (!guard.expired() && done)
            {
                done(false, "client allocation failed");
            }
        });
        return;
    }

    setQuality(handshake->client, quality);
    handshake->client->GetPassword = getPassword;
    rfbClientSetClientData(handshake->client, &handshakeTag,
                           handshake.get());

    log<level::INFO>("Connecting to RFB server",
                     entry("HOST=%s", host.c_str()), entry("PORT=%d", port));

    std::thread worker(runHandshake, handshake, host, port,
                       (unsigned int)connectTimeout.count());
    worker.detach();
}

void RfbTransport::runHandshake(std::shared_ptr<Handshake> hs,
                                std::string host, int port,
                                unsigned int timeout)
{
    rfbClient* cl = hs->client;

    free(cl->serverHost);
    cl->serverHost = strdup(host.c_str());
    cl->serverPort = port;
    cl->connectTimeout = timeout;

    // rfbInitClient frees the client on failure
    if (!rfbInitClient(cl, nullptr, nullptr))
    {
        cl = nullptr;
    }

    std::lock_guard<std::mutex> lk(hs->lock);

    hs->client = cl;

    // once closed, nothing adopts the client and ~Handshake frees it
    if (hs->io)
    {
        boost::asio::post(*hs->io, [hs]() {
            if (hs->owner)
            {
                hs->owner->completeHandshake(hs);
            }
        });
    }
}

char* RfbTransport::getPassword(rfbClient* cl)
{
    Handshake* hs = (Handshake*)rfbClientGetClientData(cl, &handshakeTag);

    if (!hs)
    {
        return strdup("");
    }

    return strdup(hs->credential.c_str());
}

void RfbTransport::completeHandshake(const std::shared_ptr<Handshake>& hs)
{
    if (hs != handshake)
    {
        return;
    }

    // the session may close this transport from the callback
    auto done = handlers.handshake;

    handshake.reset();

    if (!hs->client)
    {
        log<level::ERR>("RFB handshake failed", entry("HOST=%s", host.c_str()),
                        entry("PORT=%d", port));
        if (done)
        {
            done(false, "handshake failed");
        }
        return;
    }

    client = hs->client;
    hs->client = nullptr;
    rfbClientSetClientData(client, &handshakeTag, nullptr);
    rfbClientSetClientData(client, &transportTag, this);
    client->FinishedFrameBufferUpdate = finishedUpdate;

    boost::system::error_code ec;
    socket.assign(client->sock, ec);
    if (ec)
    {
        log<level::ERR>("Failed to watch RFB socket",
                        entry("ERROR=%s", ec.message().c_str()));
        shutdown();
        if (done)
        {
            done(false, ec.message());
        }
        return;
    }

    log<level::INFO>("Connected to RFB server",
                     entry("NAME=%s", client->desktopName
                                          ? client->desktopName
                                          : ""),
                     entry("WIDTH=%d", client->width),
                     entry("HEIGHT=%d", client->height));

    waitRead();

    if (done)
    {
        done(true, "");
    }
}

void RfbTransport::waitRead()
{
    std::weak_ptr<int> guard = lifetime;

    socket.async_wait(boost::asio::posix::stream_descriptor::wait_read,
                      [this, guard](const boost::system::error_code& ec) {
                          if (ec || guard.expired())
                          {
                              return;
                          }

                          handleRead();
                      });
}

void RfbTransport::handleRead()
{
    int available = 0;

    if (ioctl(client->sock, FIONREAD, &available) == 0 && available > 0)
    {
        counters.bytesReceived += available;
    }

    do
    {
        if (!HandleRFBServerMessage(client))
        {
            drop("connection closed by server");
            return;
        }
    } while (client->buffered > 0);

    waitRead();
}

void RfbTransport::finishedUpdate(rfbClient* cl)
{
    RfbTransport* transport =
        (RfbTransport*)rfbClientGetClientData(cl, &transportTag);

    if (transport)
    {
        transport->counters.framesReceived++;
    }
}

void RfbTransport::drop(const std::string& reason)
{
    auto closed = std::move(handlers.closed);

    log<level::WARNING>("RFB connection lost",
                        entry("REASON=%s", reason.c_str()));

    shutdown();
    handlers = Handlers();

    // the session may destroy this transport from the callback
    if (closed)
    {
        closed(reason);
    }
}

void RfbTransport::shutdown()
{
    lifetime.reset();

    if (socket.is_open())
    {
        boost::system::error_code ec;
        socket.cancel(ec);
        // rfbClientCleanup owns the descriptor
        socket.release();
    }

    if (client)
    {
        rfbClientSetClientData(client, &transportTag, nullptr);
        rfbClientCleanup(client);
        client = nullptr;
    }
}

void RfbTransport::close()
{
    if (handshake)
    {
        std::lock_guard<std::mutex> lk(handshake->lock);
        handshake->io = nullptr;
        handshake->owner = nullptr;
    }
    handshake.reset();
    handlers = Handlers();

    shutdown();
}

bool RfbTransport::sendPointer(int x, int y, uint8_t buttonMask)
{
    if (!client)
    {
        return false;
    }

    return SendPointerEvent(client, x, y, buttonMask);
}

bool RfbTransport::sendKey(uint32_t keysym, bool down)
{
    if (!client)
    {
        return false;
    }

    return SendKeyEvent(client, keysym, down ? TRUE : FALSE);
}

bool RfbTransport::sendClipboard(const std::string& text)
{
    if (!client)
    {
        return false;
    }

    std::string buffer(text);

    return SendClientCutText(client, buffer.data(), (int)buffer.size());
}

void RfbTransport::setQuality(rfbClient* cl, const QualitySettings& q)
{
    // RFB counts 9 as the best JPEG quality, the session counts 0
    cl->appData.qualityLevel = 9 - q.qualityLevel;
    cl->appData.compressLevel = q.compressionLevel;
    cl->appData.encodingsString =
        "tight zrle ultra copyrect hextile zlib corre rre raw";
}

void RfbTransport::applyQuality(const QualitySettings& q)
{
    quality = q;

    if (!client)
    {
        return;
    }

    setQuality(client, quality);
    if (!SetFormatAndEncodings(client))
    {
        log<level::ERR>("Failed to renegotiate encodings",
                        entry("QUALITY=%d", quality.qualityLevel),
                        entry("COMPRESSION=%d", quality.compressionLevel));
    }
}

int RfbTransport::getWidth() const
{
    return client ? client->width : 0;
}

int RfbTransport::getHeight() const
{
    return client ? client->height : 0;
}

Transport::Counters RfbTransport::getCounters() const
{
    Counters current = counters;

    if (client)
    {
        struct tcp_info info;
        socklen_t len = sizeof(info);

        if (getsockopt(client->sock, IPPROTO_TCP, TCP_INFO, &info, &len) == 0)
        {
            current.roundTrip = std::chrono::microseconds(info.tcpi_rtt);
        }
    }

    return current;
}

} // namespace wkvm
