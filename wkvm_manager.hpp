#pragma once

#include "wkvm_args.hpp"
#include "wkvm_input.hpp"
#include "wkvm_session.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <sdbusplus/asio/object_server.hpp>

#include <memory>
#include <string>

namespace wkvm
{

/*
 * @class Manager
 * @brief Owns the event queue and the workspace session and publishes the
 *        session on the bus
 */
class Manager
{
  public:
    /*
     * @brief Constructs Manager object
     *
     * @param[in] args - Reference to Args object
     */
    Manager(const Args& args);
    ~Manager() = default;
    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;
    Manager(Manager&&) = delete;
    Manager& operator=(Manager&&) = delete;

    /*
     * @brief Registers the methods and properties of the workspace interface
     *
     * @param[in] iface - Interface to populate, initialized by the caller
     */
    void attach(std::shared_ptr<sdbusplus::asio::dbus_interface> iface);

    /* @brief Connects if configured to and runs the event queue */
    void run();

    /* @brief Event queue shared by the session and the bus connection */
    boost::asio::io_context io;

  private:
    /* @brief Copies the changed part of the session record to the bus */
    void publish(Session::Change change);

    static Actor toActor(const std::string& name);
    static Input::Button toButton(const std::string& name);
    static Input::ScrollDirection toDirection(const std::string& name);

    /* @brief Copy of the configuration */
    Args args;
    Session session;
    /* @brief Stops the daemon on SIGINT and SIGTERM */
    boost::asio::signal_set signals;
    std::shared_ptr<sdbusplus::asio::dbus_interface> interface;
};

} // namespace wkvm
