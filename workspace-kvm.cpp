#include "wkvm_args.hpp"
#include "wkvm_manager.hpp"

#include <sdbusplus/asio/connection.hpp>
#include <sdbusplus/asio/object_server.hpp>

int main(int argc, char* argv[])
{
    wkvm::Args args(argc, argv);
    wkvm::Manager manager(args);

    auto bus = std::make_shared<sdbusplus::asio::connection>(manager.io);
    sdbusplus::asio::object_server workspaceServer(bus);

    auto interface =
        workspaceServer.add_interface("/xyz/openbmc_project/workspace",
                                      "xyz.openbmc_project.workspace_interface");

    manager.attach(interface);
    interface->initialize();

    bus->request_name("xyz.openbmc_project.workspace_kvm");

    manager.run();

    return 0;
}
