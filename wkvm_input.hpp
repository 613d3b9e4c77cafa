#pragma once

#include "wkvm_transport.hpp"
#include "wkvm_types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace wkvm
{

/*
 * @class Input
 * @brief Translates local pointer and keyboard events into RFB events and
 *        forwards them while the human owns control
 */
class Input
{
  public:
    enum class Button
    {
        left,
        middle,
        right
    };

    enum class ScrollDirection
    {
        up,
        down,
        left,
        right
    };

    /* @brief Shortcuts consumed locally instead of being forwarded */
    enum class LocalAction
    {
        zoomIn,
        zoomOut,
        zoomReset,
        toggleFullscreen,
        pinchZoom
    };

    /* @brief Modifier bits accompanying a key event */
    enum Modifier : uint8_t
    {
        shift = 0x1,
        control = 0x2,
        alt = 0x4,
        meta = 0x8
    };

    /*
     * @struct Event
     * @brief One local input event
     */
    struct Event
    {
        enum class Type
        {
            pointerMove,
            pointerButton,
            keyEvent,
            scroll
        };

        Type type;
        int x = 0;
        int y = 0;
        Button button = Button::left;
        ScrollDirection direction = ScrollDirection::up;
        /* @brief Symbolic key name or the character it produces */
        std::string key;
        bool down = false;
        uint8_t modifiers = 0;
        Clock::time_point timestamp = Clock::now();
    };

    /* @brief Returns the session's current transport, null when down */
    using TransportSource = std::function<Transport*()>;
    /*
     * @brief Called after a local shortcut was consumed
     *
     * @param[in] action - The shortcut
     * @param[in] scale  - View scale after the action
     * @param[in] full   - Fullscreen state after the action
     */
    using LocalActionHandler =
        std::function<void(LocalAction action, double scale, bool full)>;

    /* @brief Default time between the press and release of a scroll tick */
    static constexpr std::chrono::milliseconds defaultScrollDelay{10};
    /* @brief Hold time after which a touch becomes a right click */
    static constexpr std::chrono::milliseconds longPressDelay{500};
    /* @brief Travel in pixels beyond which a touch is no longer a press */
    static constexpr int touchSlop = 10;
    /* @brief Relative change of the finger distance that counts as a pinch */
    static constexpr double pinchThreshold = 0.1;

    /*
     * @brief Constructs Input object
     *
     * @param[in] io     - Session event queue
     * @param[in] s      - Session record, read for the ownership check
     * @param[in] source - Access to the current transport
     * @param[in] delay  - Scroll release delay
     */
    Input(boost::asio::io_context& io, const WorkspaceSession& s,
          TransportSource source,
          std::chrono::milliseconds delay = defaultScrollDelay);
    ~Input() = default;
    Input(const Input&) = delete;
    Input& operator=(const Input&) = delete;
    Input(Input&&) = delete;
    Input& operator=(Input&&) = delete;

    /*
     * @brief Translates and forwards one event
     *
     * @param[in] event - The local event
     *
     * @return True if the event reached the transport
     */
    bool dispatch(const Event& event);

    bool pointerMove(int x, int y);
    bool pointerButton(Button button, bool down, int x, int y);
    bool scroll(ScrollDirection direction, int x, int y);
    bool keyEvent(const std::string& key, bool down, uint8_t modifiers = 0);
    /* @brief Forwards clipboard text under the same ownership check */
    bool sendClipboard(const std::string& text);

    /*
     * @brief A finger touched the view
     *
     * The first finger presses the left button at its position. A second
     * finger starts a pinch and lifts the button.
     *
     * @param[in] id - Identifier of the finger
     * @param[in] x  - Framebuffer x-coordinate
     * @param[in] y  - Framebuffer y-coordinate
     *
     * @return True if a pointer event reached the transport
     */
    bool touchStart(int id, int x, int y);
    /*
     * @brief A finger moved; drags the pointer or adjusts the pinch zoom
     *
     * @return True if a pointer event reached the transport
     */
    bool touchMove(int id, int x, int y);
    /*
     * @brief A finger left the view; lifts the left button of a single touch
     *
     * @return True if a pointer event reached the transport
     */
    bool touchEnd(int id, int x, int y);
    /* @brief The platform cancelled every touch */
    void touchCancel();

    /* @brief Registers a handler for consumed shortcuts */
    void addLocalActionHandler(LocalActionHandler handler);

    /*
     * @brief Releases every key and button still held on the remote side,
     *        used when the human loses ownership
     */
    void releaseHeld();

    inline double getScale() const
    {
        return scalePercent / 100.0;
    }

    inline bool isFullscreen() const
    {
        return fullscreen;
    }

    /*
     * @brief Maps a key name or character to an X keysym
     *
     * @param[in] key - Symbolic key name or a single UTF-8 character
     *
     * @return The keysym, XK_VoidSymbol if the key is unknown
     */
    static uint32_t keyToKeysym(const std::string& key);
    /* @brief RFB button mask bit of a button */
    static uint8_t buttonToMask(Button button);
    /* @brief RFB button mask bit of a scroll direction */
    static uint8_t scrollToMask(ScrollDirection direction);

  private:
    /*
     * @brief Detects and runs a local shortcut
     *
     * @return True if the event was consumed
     */
    bool interceptShortcut(const Event& event);
    /* @brief Ownership check performed for every event */
    bool ownsControl() const;
    /*
     * @brief Translates an event and writes it to the transport
     *
     * @return True if the transport accepted the event
     */
    bool forward(Transport& transport, const Event& event);
    /* @brief Throws if a position is outside the remote framebuffer */
    void checkPosition(const Transport& transport, int x, int y) const;
    /* @brief Sends the release half of a scroll tick after the delay */
    void scheduleScrollRelease(int x, int y);
    /* @brief Turns a held, unmoved single touch into a right click */
    void longPress(int id);
    /* @brief Distance between the first two fingers */
    double fingerDistance() const;
    /* @brief Applies a zoom step and notifies the local action handlers */
    void setScale(LocalAction action, int percent);

    /*
     * @struct Touch
     * @brief One finger on the view
     */
    struct Touch
    {
        int startX;
        int startY;
        int x;
        int y;
        /* @brief Whether this finger presses the left button */
        bool pressing;
    };

    /* @brief Session event queue */
    boost::asio::io_context& io;
    /* @brief Session record */
    const WorkspaceSession& session;
    /* @brief Access to the current transport */
    TransportSource transportSource;
    /* @brief Scroll release delay */
    std::chrono::milliseconds scrollDelay;
    /* @brief Mask of the buttons held down */
    uint8_t buttonMask;
    /* @brief Last pointer position sent */
    int pointerX;
    int pointerY;
    /* @brief Keysyms pressed and not yet released */
    std::set<uint32_t> keysDown;
    /* @brief Keys whose press was consumed as a shortcut */
    std::set<std::string> consumedKeys;
    /* @brief Local view zoom in percent */
    int scalePercent;
    bool fullscreen;
    std::vector<LocalActionHandler> localActionHandlers;
    /* @brief Fingers on the view by identifier */
    std::map<int, Touch> touches;
    /* @brief Finger distance at the last pinch step, 0 when not pinching */
    double pinchDistance;
    /* @brief Fires the long press of a single touch */
    boost::asio::steady_timer longPressTimer;
    /* @brief Invalidates long presses queued before a cancel */
    uint64_t longPressGeneration;
    /* @brief Expires with the object so queued scroll releases are ignored */
    std::shared_ptr<int> lifetime;
};

} // namespace wkvm
