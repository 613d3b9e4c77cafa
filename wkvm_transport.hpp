#pragma once

#include "wkvm_types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace wkvm
{

/*
 * @class Transport
 * @brief Persistent connection to the remote desktop gateway
 *
 * Implementations deliver every callback on the session's io_context.
 */
class Transport
{
  public:
    /*
     * @struct Handlers
     * @brief Callbacks through which the transport reports to its session
     */
    struct Handlers
    {
        /* @brief Handshake finished; the string describes a failure */
        std::function<void(bool success, const std::string& reason)>
            handshake;
        /* @brief Connection dropped after a successful handshake */
        std::function<void(const std::string& reason)> closed;
    };

    /*
     * @struct Counters
     * @brief Running downstream counters since the handshake
     */
    struct Counters
    {
        uint64_t bytesReceived = 0;
        uint64_t framesReceived = 0;
        /* @brief Smoothed round-trip time, zero when unknown */
        std::chrono::microseconds roundTrip{0};
    };

    Transport() = default;
    virtual ~Transport() = default;
    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;
    Transport(Transport&&) = delete;
    Transport& operator=(Transport&&) = delete;

    /*
     * @brief Starts the protocol handshake
     *
     * @param[in] credential - Opaque secret for the gateway's authentication
     * @param[in] quality    - Quality settings to negotiate
     * @param[in] handlers   - Callbacks for handshake result and drops
     */
    virtual void open(const std::string& credential,
                      const QualitySettings& quality, Handlers handlers) = 0;
    /* @brief Tears the connection down; no callback fires afterwards */
    virtual void close() = 0;

    /*
     * @brief Sends a pointer event
     *
     * @param[in] x          - Pointer x-coordinate
     * @param[in] y          - Pointer y-coordinate
     * @param[in] buttonMask - Bitmask of the buttons held down
     *
     * @return False if the message could not be written
     */
    virtual bool sendPointer(int x, int y, uint8_t buttonMask) = 0;
    /*
     * @brief Sends a key event
     *
     * @param[in] keysym - X keysym
     * @param[in] down   - Whether the key is pressed or released
     *
     * @return False if the message could not be written
     */
    virtual bool sendKey(uint32_t keysym, bool down) = 0;
    /* @brief Sends client cut text */
    virtual bool sendClipboard(const std::string& text) = 0;
    /* @brief Renegotiates encodings for new quality settings */
    virtual void applyQuality(const QualitySettings& quality) = 0;

    /* @brief Width of the remote framebuffer, 0 before the handshake */
    virtual int getWidth() const = 0;
    /* @brief Height of the remote framebuffer, 0 before the handshake */
    virtual int getHeight() const = 0;
    /* @brief Samples the downstream counters */
    virtual Counters getCounters() const = 0;
};

} // namespace wkvm
