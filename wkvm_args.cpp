#include "wkvm_args.hpp"

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>

#include <fstream>
#include <iterator>

#include <phosphor-logging/elog-errors.hpp>
#include <phosphor-logging/elog.hpp>
#include <phosphor-logging/log.hpp>
#include <xyz/openbmc_project/Common/error.hpp>

namespace wkvm
{

using namespace phosphor::logging;
using namespace sdbusplus::xyz::openbmc_project::Common::Error;

Args::Args() :
    host("localhost"), port(5900), maxRetries(5), initialBackoff(2000),
    maxBackoff(30000), connectTimeout(10), requestTimeout(30),
    qualityLevel(6), compressionLevel(2), adaptiveQuality(false),
    connectOnStart(true)
{}

Args::Args(int argc, char* argv[]) : Args()
{
    int option;
    const char* opts = "a:p:t:r:b:m:c:q:z:w:dnh";
    struct option lopts[] = {
        {"address", 1, 0, 'a'},        {"port", 1, 0, 'p'},
        {"tokenFile", 1, 0, 't'},      {"retries", 1, 0, 'r'},
        {"backoff", 1, 0, 'b'},        {"maxBackoff", 1, 0, 'm'},
        {"connectTimeout", 1, 0, 'c'}, {"quality", 1, 0, 'q'},
        {"compression", 1, 0, 'z'},    {"requestTimeout", 1, 0, 'w'},
        {"adaptive", 0, 0, 'd'},       {"noConnect", 0, 0, 'n'},
        {"help", 0, 0, 'h'},           {0, 0, 0, 0}};
    long value;

    while ((option = getopt_long(argc, argv, opts, lopts, NULL)) != -1)
    {
        switch (option)
        {
            case 'a':
                host = std::string(optarg);
                break;
            case 'p':
                port = (int)strtol(optarg, NULL, 0);
                if (port <= 0 || port > 65535)
                    port = 5900;
                break;
            case 't':
                readCredential(optarg);
                break;
            case 'r':
                maxRetries = (int)strtol(optarg, NULL, 0);
                if (maxRetries < 0 || maxRetries > 100)
                    maxRetries = 5;
                break;
            case 'b':
                value = strtol(optarg, NULL, 0);
                if (value > 0)
                    initialBackoff = std::chrono::milliseconds(value);
                break;
            case 'm':
                value = strtol(optarg, NULL, 0);
                if (value > 0)
                    maxBackoff = std::chrono::milliseconds(value);
                break;
            case 'c':
                value = strtol(optarg, NULL, 0);
                if (value > 0 && value <= 300)
                    connectTimeout = std::chrono::seconds(value);
                break;
            case 'q':
                qualityLevel = (int)strtol(optarg, NULL, 0);
                if (qualityLevel < 0 || qualityLevel > 9)
                    qualityLevel = 6;
                break;
            case 'z':
                compressionLevel = (int)strtol(optarg, NULL, 0);
                if (compressionLevel < 0 || compressionLevel > 9)
                    compressionLevel = 2;
                break;
            case 'w':
                value = strtol(optarg, NULL, 0);
                if (value > 0)
                    requestTimeout = std::chrono::seconds(value);
                break;
            case 'd':
                adaptiveQuality = true;
                break;
            case 'n':
                connectOnStart = false;
                break;
            case 'h':
                printUsage();
                exit(0);
        }
    }

    if (maxBackoff < initialBackoff)
    {
        maxBackoff = initialBackoff;
    }

    if (host.empty())
    {
        log<level::ERR>("No RFB server address given");
        elog<InvalidArgument>(
            xyz::openbmc_project::Common::InvalidArgument::ARGUMENT_NAME(
                "address"),
            xyz::openbmc_project::Common::InvalidArgument::ARGUMENT_VALUE(""));
    }
}

void Args::setBackoff(int retries, std::chrono::milliseconds initial,
                      std::chrono::milliseconds max)
{
    maxRetries = retries;
    initialBackoff = initial;
    maxBackoff = max < initial ? initial : max;
}

void Args::setConnectTimeout(std::chrono::seconds timeout)
{
    if (timeout.count() > 0)
    {
        connectTimeout = timeout;
    }
}

void Args::readCredential(const std::string& path)
{
    std::ifstream tokenFile(path);

    if (!tokenFile)
    {
        log<level::ERR>("Failed to open token file",
                        entry("PATH=%s", path.c_str()));
        elog<InvalidArgument>(
            xyz::openbmc_project::Common::InvalidArgument::ARGUMENT_NAME(
                "tokenFile"),
            xyz::openbmc_project::Common::InvalidArgument::ARGUMENT_VALUE(
                path.c_str()));
    }

    credential.assign(std::istreambuf_iterator<char>(tokenFile),
                      std::istreambuf_iterator<char>());

    // tokens are usually written with a trailing newline
    while (!credential.empty() &&
           (credential.back() == '\n' || credential.back() == '\r'))
    {
        credential.pop_back();
    }
}

void Args::printUsage()
{
    fprintf(stderr, "Workspace KVM control daemon\n");
    fprintf(stderr, "Usage: workspace-kvm [options]\n");
    fprintf(stderr, "-a, --address host       RFB server host\n");
    fprintf(stderr, "-p, --port port          RFB server port\n");
    fprintf(stderr, "-t, --tokenFile file     file holding the credential\n");
    fprintf(stderr, "-r, --retries n          reconnect attempts\n");
    fprintf(stderr, "-b, --backoff ms         initial reconnect delay\n");
    fprintf(stderr, "-m, --maxBackoff ms      maximum reconnect delay\n");
    fprintf(stderr, "-c, --connectTimeout s   handshake timeout\n");
    fprintf(stderr, "-q, --quality level      initial quality level (0-9)\n");
    fprintf(stderr,
            "-z, --compression level  initial compression level (0-9)\n");
    fprintf(stderr,
            "-w, --requestTimeout s   lifetime of a control request\n");
    fprintf(stderr, "-d, --adaptive           adapt quality to latency\n");
    fprintf(stderr, "-n, --noConnect          don't connect at startup\n");
    fprintf(stderr, "-h, --help               show this message and exit\n");
}

} // namespace wkvm
