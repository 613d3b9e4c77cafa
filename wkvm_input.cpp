#include "wkvm_input.hpp"

#include <rfb/keysym.h>

#include <boost/asio/steady_timer.hpp>
#include <phosphor-logging/log.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>

namespace wkvm
{

using namespace phosphor::logging;

static constexpr int minScalePercent = 50;
static constexpr int maxScalePercent = 200;
static constexpr int scaleStepPercent = 10;

/* @brief Symbolic key names (DOM and X spellings) mapped to keysyms */
static const std::map<std::string, uint32_t> keyTable = {
    {"Backspace", XK_BackSpace},
    {"BackSpace", XK_BackSpace},
    {"Tab", XK_Tab},
    {"Enter", XK_Return},
    {"Return", XK_Return},
    {"Escape", XK_Escape},
    {"Esc", XK_Escape},
    {"Space", XK_space},
    {"space", XK_space},
    {"Delete", XK_Delete},
    {"Insert", XK_Insert},
    {"Home", XK_Home},
    {"End", XK_End},
    {"PageUp", XK_Page_Up},
    {"Page_Up", XK_Page_Up},
    {"PageDown", XK_Page_Down},
    {"Page_Down", XK_Page_Down},
    {"ArrowLeft", XK_Left},
    {"Left", XK_Left},
    {"ArrowUp", XK_Up},
    {"Up", XK_Up},
    {"ArrowRight", XK_Right},
    {"Right", XK_Right},
    {"ArrowDown", XK_Down},
    {"Down", XK_Down},
    {"Shift", XK_Shift_L},
    {"Shift_L", XK_Shift_L},
    {"Shift_R", XK_Shift_R},
    {"Control", XK_Control_L},
    {"Control_L", XK_Control_L},
    {"Control_R", XK_Control_R},
    {"Alt", XK_Alt_L},
    {"Alt_L", XK_Alt_L},
    {"Alt_R", XK_Alt_R},
    {"AltGraph", XK_Mode_switch},
    {"Meta", XK_Super_L},
    {"OS", XK_Super_L},
    {"Super_L", XK_Super_L},
    {"Super_R", XK_Super_R},
    {"CapsLock", XK_Caps_Lock},
    {"Caps_Lock", XK_Caps_Lock},
    {"NumLock", XK_Num_Lock},
    {"Num_Lock", XK_Num_Lock},
    {"ScrollLock", XK_Scroll_Lock},
    {"Scroll_Lock", XK_Scroll_Lock},
    {"Pause", XK_Pause},
    {"PrintScreen", XK_Print},
    {"Print", XK_Print},
    {"ContextMenu", XK_Menu},
    {"Menu", XK_Menu},
    {"KP_Enter", XK_KP_Enter},
    {"KP_Add", XK_KP_Add},
    {"KP_Subtract", XK_KP_Subtract},
    {"KP_Multiply", XK_KP_Multiply},
    {"KP_Divide", XK_KP_Divide},
    {"KP_Decimal", XK_KP_Decimal},
    {"KP_Equal", XK_KP_Equal},
};

/*
 * @brief Decodes a string holding exactly one UTF-8 encoded character
 *
 * @return The code point, or nothing if the string is not one character
 */
static std::optional<uint32_t> singleCodePoint(const std::string& s)
{
    if (s.empty())
    {
        return std::nullopt;
    }

    // smallest code point each sequence length may encode
    static constexpr uint32_t minForLength[] = {0, 0, 0x80, 0x800, 0x10000};

    auto lead = (unsigned char)s[0];
    size_t length;
    uint32_t cp;

    if (lead < 0x80)
    {
        length = 1;
        cp = lead;
    }
    else if (lead >= 0xc2 && lead <= 0xdf)
    {
        length = 2;
        cp = lead & 0x1f;
    }
    else if ((lead & 0xf0) == 0xe0)
    {
        length = 3;
        cp = lead & 0x0f;
    }
    else if (lead >= 0xf0 && lead <= 0xf4)
    {
        length = 4;
        cp = lead & 0x07;
    }
    else
    {
        return std::nullopt;
    }

    if (s.size() != length)
    {
        return std::nullopt;
    }

    for (size_t i = 1; i < length; ++i)
    {
        auto c = (unsigned char)s[i];

        if ((c & 0xc0) != 0x80)
        {
            return std::nullopt;
        }
        cp = (cp << 6) | (c & 0x3f);
    }

    // overlong forms, UTF-16 surrogates and values past U+10FFFF
    if (cp < minForLength[length] || (cp >= 0xd800 && cp <= 0xdfff) ||
        cp > 0x10ffff)
    {
        return std::nullopt;
    }

    return cp;
}

Input::Input(boost::asio::io_context& io, const WorkspaceSession& s,
             TransportSource source, std::chrono::milliseconds delay) :
    io(io), session(s), transportSource(std::move(source)),
    scrollDelay(delay), buttonMask(0), pointerX(0), pointerY(0),
    scalePercent(100), fullscreen(false), pinchDistance(0),
    longPressTimer(io), longPressGeneration(0),
    lifetime(std::make_shared<int>(0))
{}

uint32_t Input::keyToKeysym(const std::string& key)
{
    auto it = keyTable.find(key);

    if (it != keyTable.end())
    {
        return it->second;
    }

    if (key.size() >= 2 && key.size() <= 3 && key[0] == 'F' &&
        std::all_of(key.begin() + 1, key.end(),
                    [](char c) { return c >= '0' && c <= '9'; }))
    {
        int n = std::stoi(key.substr(1));

        if (n >= 1 && n <= 24)
        {
            return XK_F1 + (n - 1);
        }
    }

    if (key.size() == 4 && key.compare(0, 3, "KP_") == 0 && key[3] >= '0' &&
        key[3] <= '9')
    {
        return XK_KP_0 + (key[3] - '0');
    }

    auto cp = singleCodePoint(key);

    if (cp)
    {
        // Latin-1 keysyms equal their code points, the rest of Unicode is
        // offset into the 0x01000000 plane
        if (*cp < 0x100)
        {
            return *cp;
        }

        return 0x01000000 | *cp;
    }

    log<level::DEBUG>("Unmapped key", entry("KEY=%s", key.c_str()));
    return XK_VoidSymbol;
}

uint8_t Input::buttonToMask(Button button)
{
    switch (button)
    {
        case Button::left:
            return 0x1;
        case Button::middle:
            return 0x2;
        case Button::right:
            return 0x4;
    }

    return 0;
}

uint8_t Input::scrollToMask(ScrollDirection direction)
{
    switch (direction)
    {
        case ScrollDirection::up:
            return 0x8;
        case ScrollDirection::down:
            return 0x10;
        case ScrollDirection::left:
            return 0x20;
        case ScrollDirection::right:
            return 0x40;
    }

    return 0;
}

bool Input::pointerMove(int x, int y)
{
    Event event{Event::Type::pointerMove};

    event.x = x;
    event.y = y;

    return dispatch(event);
}

bool Input::pointerButton(Button button, bool down, int x, int y)
{
    Event event{Event::Type::pointerButton};

    event.button = button;
    event.down = down;
    event.x = x;
    event.y = y;

    return dispatch(event);
}

bool Input::scroll(ScrollDirection direction, int x, int y)
{
    Event event{Event::Type::scroll};

    event.direction = direction;
    event.x = x;
    event.y = y;

    return dispatch(event);
}

bool Input::keyEvent(const std::string& key, bool down, uint8_t modifiers)
{
    Event event{Event::Type::keyEvent};

    event.key = key;
    event.down = down;
    event.modifiers = modifiers;

    return dispatch(event);
}

bool Input::dispatch(const Event& event)
{
    if (event.type == Event::Type::keyEvent && interceptShortcut(event))
    {
        return false;
    }

    if (!ownsControl())
    {
        return false;
    }

    Transport* transport = transportSource();

    if (!transport)
    {
        return false;
    }

    try
    {
        return forward(*transport, event);
    }
    catch (const std::exception& e)
    {
        log<level::ERR>("Dropped input event", entry("ERROR=%s", e.what()),
                        entry("TYPE=%d", (int)event.type));
    }

    return false;
}

bool Input::sendClipboard(const std::string& text)
{
    if (!ownsControl())
    {
        return false;
    }

    Transport* transport = transportSource();

    if (!transport)
    {
        return false;
    }

    if (!transport->sendClipboard(text))
    {
        log<level::ERR>("Failed to send clipboard text");
        return false;
    }

    return true;
}

bool Input::interceptShortcut(const Event& event)
{
    if (!event.down)
    {
        // the release of a consumed key is consumed as well
        return consumedKeys.erase(event.key) > 0;
    }

    std::optional<LocalAction> action;
    bool command = event.modifiers & (Modifier::control | Modifier::meta);

    if (command && (event.key == "+" || event.key == "="))
    {
        action = LocalAction::zoomIn;
        scalePercent = std::min(scalePercent + scaleStepPercent,
                                maxScalePercent);
    }
    else if (command && event.key == "-")
    {
        action = LocalAction::zoomOut;
        scalePercent = std::max(scalePercent - scaleStepPercent,
                                minScalePercent);
    }
    else if (command && event.key == "0")
    {
        action = LocalAction::zoomReset;
        scalePercent = 100;
    }
    else if (event.key == "F11")
    {
        action = LocalAction::toggleFullscreen;
        fullscreen = !fullscreen;
    }

    if (!action)
    {
        return false;
    }

    consumedKeys.insert(event.key);

    for (const auto& handler : localActionHandlers)
    {
        handler(*action, getScale(), fullscreen);
    }

    return true;
}

bool Input::ownsControl() const
{
    return session.control.owner == Actor::human &&
           session.connection.isConnected();
}

void Input::checkPosition(const Transport& transport, int x, int y) const
{
    int width = transport.getWidth();
    int height = transport.getHeight();

    if (x < 0 || y < 0 || (width > 0 && x >= width) ||
        (height > 0 && y >= height) || x > UINT16_MAX || y > UINT16_MAX)
    {
        throw std::out_of_range("pointer position " + std::to_string(x) +
                                "," + std::to_string(y) +
                                " outside the framebuffer");
    }
}

bool Input::forward(Transport& transport, const Event& event)
{
    bool sent = false;

    switch (event.type)
    {
        case Event::Type::pointerMove:
            checkPosition(transport, event.x, event.y);
            pointerX = event.x;
            pointerY = event.y;
            sent = transport.sendPointer(pointerX, pointerY, buttonMask);
            break;

        case Event::Type::pointerButton:
            checkPosition(transport, event.x, event.y);
            pointerX = event.x;
            pointerY = event.y;
            if (event.down)
            {
                buttonMask |= buttonToMask(event.button);
            }
            else
            {
                buttonMask &= ~buttonToMask(event.button);
            }
            sent = transport.sendPointer(pointerX, pointerY, buttonMask);
            break;

        case Event::Type::scroll:
            checkPosition(transport, event.x, event.y);
            pointerX = event.x;
            pointerY = event.y;
            sent = transport.sendPointer(
                pointerX, pointerY,
                buttonMask | scrollToMask(event.direction));
            if (sent)
            {
                scheduleScrollRelease(pointerX, pointerY);
            }
            break;

        case Event::Type::keyEvent:
        {
            uint32_t keysym = keyToKeysym(event.key);

            if (event.down)
            {
                keysDown.insert(keysym);
            }
            else
            {
                keysDown.erase(keysym);
            }
            sent = transport.sendKey(keysym, event.down);
            break;
        }
    }

    if (!sent)
    {
        log<level::ERR>("Failed to write input event",
                        entry("TYPE=%d", (int)event.type));
    }

    return sent;
}

void Input::scheduleScrollRelease(int x, int y)
{
    auto timer = std::make_shared<boost::asio::steady_timer>(io, scrollDelay);
    std::weak_ptr<int> guard = lifetime;

    timer->async_wait(
        [this, timer, guard, x, y](const boost::system::error_code& ec) {
            if (ec || guard.expired())
            {
                return;
            }

            // completes a press that was already forwarded
            Transport* transport = transportSource();

            if (transport && !transport->sendPointer(x, y, buttonMask))
            {
                log<level::ERR>("Failed to release scroll button");
            }
        });
}

bool Input::touchStart(int id, int x, int y)
{
    touches[id] = Touch{x, y, x, y, false};

    if (touches.size() == 1)
    {
        uint64_t generation = ++longPressGeneration;
        std::weak_ptr<int> guard = lifetime;

        longPressTimer.expires_after(longPressDelay);
        longPressTimer.async_wait(
            [this, guard, generation, id](const boost::system::error_code& ec) {
                if (ec || guard.expired() ||
                    generation != longPressGeneration)
                {
                    return;
                }

                longPress(id);
            });

        bool sent = pointerButton(Button::left, true, x, y);

        touches[id].pressing = sent;
        return sent;
    }

    // a second finger turns the gesture into a pinch
    longPressGeneration++;
    longPressTimer.cancel();
    pinchDistance = fingerDistance();

    bool sent = false;

    for (auto& [other, touch] : touches)
    {
        if (touch.pressing)
        {
            touch.pressing = false;
            sent = pointerButton(Button::left, false, touch.x, touch.y);
        }
    }

    return sent;
}

bool Input::touchMove(int id, int x, int y)
{
    auto it = touches.find(id);

    if (it == touches.end())
    {
        return false;
    }

    Touch& touch = it->second;

    touch.x = x;
    touch.y = y;

    if (touches.size() == 1)
    {
        if (std::hypot(x - touch.startX, y - touch.startY) > touchSlop)
        {
            longPressGeneration++;
            longPressTimer.cancel();
        }

        return pointerMove(x, y);
    }

    double distance = fingerDistance();

    if (pinchDistance <= 0)
    {
        pinchDistance = distance;
        return false;
    }

    double ratio = distance / pinchDistance;

    if (std::abs(ratio - 1.0) > pinchThreshold)
    {
        setScale(LocalAction::pinchZoom,
                 (int)std::lround(scalePercent * ratio));
        pinchDistance = distance;
    }

    return false;
}

bool Input::touchEnd(int id, int x, int y)
{
    auto it = touches.find(id);

    if (it == touches.end())
    {
        return false;
    }

    bool pressing = it->second.pressing;
    bool sent = false;

    touches.erase(it);

    if (touches.empty())
    {
        longPressGeneration++;
        longPressTimer.cancel();
    }

    if (touches.size() < 2)
    {
        pinchDistance = 0;
    }

    if (pressing)
    {
        sent = pointerButton(Button::left, false, x, y);
    }

    return sent;
}

void Input::touchCancel()
{
    longPressGeneration++;
    longPressTimer.cancel();
    pinchDistance = 0;

    for (const auto& [id, touch] : touches)
    {
        if (touch.pressing &&
            !pointerButton(Button::left, false, touch.x, touch.y))
        {
            log<level::DEBUG>("Cancelled touch not released remotely",
                              entry("TOUCH=%d", id));
        }
    }

    touches.clear();
}

void Input::longPress(int id)
{
    auto it = touches.find(id);

    if (it == touches.end() || touches.size() != 1)
    {
        return;
    }

    Touch& touch = it->second;

    if (touch.pressing)
    {
        touch.pressing = false;
        if (!pointerButton(Button::left, false, touch.x, touch.y))
        {
            return;
        }
    }

    if (!pointerButton(Button::right, true, touch.x, touch.y) ||
        !pointerButton(Button::right, false, touch.x, touch.y))
    {
        log<level::DEBUG>("Long press not forwarded", entry("TOUCH=%d", id));
    }
}

double Input::fingerDistance() const
{
    if (touches.size() < 2)
    {
        return 0;
    }

    const Touch& first = touches.begin()->second;
    const Touch& second = std::next(touches.begin())->second;

    return std::hypot(second.x - first.x, second.y - first.y);
}

void Input::setScale(LocalAction action, int percent)
{
    scalePercent = std::clamp(percent, minScalePercent, maxScalePercent);

    for (const auto& handler : localActionHandlers)
    {
        handler(action, getScale(), fullscreen);
    }
}

void Input::addLocalActionHandler(LocalActionHandler handler)
{
    localActionHandlers.push_back(std::move(handler));
}

void Input::releaseHeld()
{
    Transport* transport = transportSource();

    if (transport)
    {
        for (uint32_t keysym : keysDown)
        {
            if (!transport->sendKey(keysym, false))
            {
                log<level::ERR>("Failed to release held key",
                                entry("KEYSYM=0x%x", keysym));
            }
        }

        if (buttonMask && !transport->sendPointer(pointerX, pointerY, 0))
        {
            log<level::ERR>("Failed to release held buttons");
        }
    }

    keysDown.clear();
    buttonMask = 0;

    longPressGeneration++;
    longPressTimer.cancel();
    for (auto& [id, touch] : touches)
    {
        touch.pressing = false;
    }
}

} // namespace wkvm
