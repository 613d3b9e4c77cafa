#pragma once

#include <chrono>
#include <string>

namespace wkvm
{
/*
 * @class Args
 * @brief Command line argument parser and storage
 */
class Args
{
  public:
    /*
     * @brief Constructs Args object
     *
     * @param[in] argc - The number of arguments in the command line call
     * @param[in] argv - The array of arguments from the command line
     */
    Args(int argc, char* argv[]);
    /* @brief Constructs Args object holding the defaults */
    Args();
    ~Args() = default;
    Args(const Args&) = default;
    Args& operator=(const Args&) = default;
    Args(Args&&) = default;
    Args& operator=(Args&&) = default;

    /*
     * @brief Get the host name of the RFB server
     *
     * @return Reference to the string storing the host name
     */
    inline const std::string& getHost() const
    {
        return host;
    }

    /*
     * @brief Get the TCP port of the RFB server
     *
     * @return Value of the port
     */
    inline int getPort() const
    {
        return port;
    }

    /*
     * @brief Get the opaque credential read from the token file
     *
     * @return Reference to the string storing the credential, empty if none
     */
    inline const std::string& getCredential() const
    {
        return credential;
    }

    /*
     * @brief Get the number of reconnect attempts before giving up
     *
     * @return Value of the retry budget
     */
    inline int getMaxRetries() const
    {
        return maxRetries;
    }

    /* @brief Get the delay before the first reconnect attempt */
    inline std::chrono::milliseconds getInitialBackoff() const
    {
        return initialBackoff;
    }

    /* @brief Get the cap on the reconnect delay */
    inline std::chrono::milliseconds getMaxBackoff() const
    {
        return maxBackoff;
    }

    /* @brief Get the handshake timeout */
    inline std::chrono::seconds getConnectTimeout() const
    {
        return connectTimeout;
    }

    /* @brief Get the lifetime of a pending control request */
    inline std::chrono::seconds getRequestTimeout() const
    {
        return requestTimeout;
    }

    /* @brief Get the initial quality level (0-9) */
    inline int getQualityLevel() const
    {
        return qualityLevel;
    }

    /* @brief Get the initial compression level (0-9) */
    inline int getCompressionLevel() const
    {
        return compressionLevel;
    }

    /*
     * @brief Get the adaptive quality setting
     *
     * @return True if quality follows the measured connection quality
     */
    inline bool getAdaptiveQuality() const
    {
        return adaptiveQuality;
    }

    /*
     * @brief Get the startup connection setting
     *
     * @return True if the session connects as soon as the daemon starts
     */
    inline bool getConnectOnStart() const
    {
        return connectOnStart;
    }

    /*
     * @brief Set the reconnect policy, used by callers that build Args in
     *        code rather than from a command line
     */
    void setBackoff(int retries, std::chrono::milliseconds initial,
                    std::chrono::milliseconds max);

    /* @brief Set the handshake deadline; zero keeps the current value */
    void setConnectTimeout(std::chrono::seconds timeout);

  private:
    /* @brief Prints the application usage to stderr */
    void printUsage();
    /*
     * @brief Reads the credential from a file
     *
     * @param[in] path - Path to the token file
     */
    void readCredential(const std::string& path);

    /* @brief Host name of the RFB server */
    std::string host;
    /* @brief TCP port of the RFB server */
    int port;
    /* @brief Opaque credential for the RFB handshake */
    std::string credential;
    /* @brief Reconnect attempts before entering the error state */
    int maxRetries;
    /* @brief Delay before the first reconnect attempt */
    std::chrono::milliseconds initialBackoff;
    /* @brief Cap on the reconnect delay */
    std::chrono::milliseconds maxBackoff;
    /* @brief Handshake timeout */
    std::chrono::seconds connectTimeout;
    /* @brief Lifetime of a pending control request */
    std::chrono::seconds requestTimeout;
    /* @brief Initial quality level */
    int qualityLevel;
    /* @brief Initial compression level */
    int compressionLevel;
    /* @brief Adapt quality to the measured connection quality */
    bool adaptiveQuality;
    /* @brief Connect as soon as the daemon starts */
    bool connectOnStart;
};

} // namespace wkvm
