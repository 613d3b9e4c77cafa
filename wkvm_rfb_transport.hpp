#pragma once

#include "wkvm_transport.hpp"

#include <rfb/rfbclient.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace wkvm
{

/*
 * @class RfbTransport
 * @brief Transport over the RFB protocol, backed by libvncclient
 */
class RfbTransport : public Transport
{
  public:
    /*
     * @brief Constructs RfbTransport object
     *
     * @param[in] io      - Session event queue
     * @param[in] h       - Host name of the RFB server
     * @param[in] p       - TCP port of the RFB server
     * @param[in] timeout - Connect timeout passed to libvncclient
     */
    RfbTransport(boost::asio::io_context& io, const std::string& h, int p,
                 std::chrono::seconds timeout);
    ~RfbTransport() override;

    void open(const std::string& credential, const QualitySettings& quality,
              Handlers handlers) override;
    void close() override;

    bool sendPointer(int x, int y, uint8_t buttonMask) override;
    bool sendKey(uint32_t keysym, bool down) override;
    bool sendClipboard(const std::string& text) override;
    void applyQuality(const QualitySettings& quality) override;

    int getWidth() const override;
    int getHeight() const override;
    Counters getCounters() const override;

  private:
    /*
     * @struct Handshake
     * @brief State shared between the session and the handshake thread
     */
    struct Handshake
    {
        ~Handshake();

        /* @brief Guards io against close() racing the final post */
        std::mutex lock;
        /* @brief Queue to report to, null once the transport is closed */
        boost::asio::io_context* io = nullptr;
        /* @brief Transport to complete, only touched on the io_context */
        RfbTransport* owner = nullptr;
        /* @brief Connection, owned here until the session adopts it */
        rfbClient* client = nullptr;
        std::string credential;
    };

    /* @brief libvncclient password callback */
    static char* getPassword(rfbClient* cl);
    /* @brief libvncclient end-of-update callback */
    static void finishedUpdate(rfbClient* cl);
    /* @brief Runs the blocking handshake on a worker thread */
    static void runHandshake(std::shared_ptr<Handshake> hs, std::string host,
                             int port, unsigned int timeout);

    /*
     * @brief Adopts the connection from a finished handshake
     *
     * @param[in] hs - Handshake state, holds the client on success
     */
    void completeHandshake(const std::shared_ptr<Handshake>& hs);
    /* @brief Waits for the socket to become readable */
    void waitRead();
    /* @brief Processes pending server messages */
    void handleRead();
    /*
     * @brief Shuts the connection down and reports a drop
     *
     * @param[in] reason - Description of the failure
     */
    void drop(const std::string& reason);
    /* @brief Releases the socket and the libvncclient connection */
    void shutdown();
    /* @brief Writes quality settings into the client */
    void setQuality(rfbClient* cl, const QualitySettings& quality);

    /* @brief Session event queue */
    boost::asio::io_context& io;
    /* @brief Host name of the RFB server */
    std::string host;
    /* @brief TCP port of the RFB server */
    int port;
    /* @brief Connect timeout */
    std::chrono::seconds connectTimeout;
    /* @brief Connected libvncclient instance, null when down */
    rfbClient* client;
    /* @brief Readiness watcher on the client socket */
    boost::asio::posix::stream_descriptor socket;
    /* @brief Handshake in flight, if any */
    std::shared_ptr<Handshake> handshake;
    /* @brief Session callbacks */
    Handlers handlers;
    /* @brief Quality settings to apply on the next handshake */
    QualitySettings quality;
    /* @brief Downstream counters */
    Counters counters;
    /* @brief Expires on close() so that queued completions are ignored */
    std::shared_ptr<int> lifetime;
};

} // namespace wkvm
