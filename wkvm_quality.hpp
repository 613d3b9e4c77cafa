#pragma once

#include "wkvm_types.hpp"

#include <string>

namespace wkvm
{

/*
 * @class Quality
 * @brief Holds the quality/compression pair of a session and the policy
 *        that adapts it to the measured connection quality
 */
class Quality
{
  public:
    static constexpr int minLevel = 0;
    static constexpr int maxLevel = 9;
    /* @brief Consecutive degraded samples before trading fidelity away */
    static constexpr unsigned int degradeAfter = 3;
    /* @brief Consecutive excellent samples before restoring fidelity */
    static constexpr unsigned int recoverAfter = 10;

    /*
     * @brief Constructs Quality object
     *
     * @param[in] q - Initial quality level
     * @param[in] c - Initial compression level
     */
    Quality(int q = 6, int c = 2);
    ~Quality() = default;
    Quality(const Quality&) = default;
    Quality& operator=(const Quality&) = default;
    Quality(Quality&&) = default;
    Quality& operator=(Quality&&) = default;

    inline const QualitySettings& getSettings() const
    {
        return settings;
    }

    /*
     * @brief Lowers both levels by one step (more fidelity, more bandwidth)
     *
     * @return True if the settings changed
     */
    bool improveQuality();
    /*
     * @brief Raises both levels by one step (less bandwidth, lower latency)
     *
     * @return True if the settings changed
     */
    bool improvePerformance();
    /*
     * @brief Sets both levels, clamping each into range
     *
     * @return True if the settings changed
     */
    bool set(int q, int c);
    /*
     * @brief Applies a named preset
     *
     * @param[in] name - high-quality, balanced, high-performance or mobile
     *
     * @return False if the preset is unknown
     */
    bool applyPreset(const std::string& name);
    /*
     * @brief Feeds one connection quality sample to the adaptive policy
     *
     * @param[in] sample - Quality class of the latest metrics window
     *
     * @return True if the settings changed
     */
    bool adapt(ConnectionQuality sample);

  private:
    /* @brief Current settings */
    QualitySettings settings;
    /* @brief Consecutive poor or critical samples */
    unsigned int degradedSamples;
    /* @brief Consecutive excellent samples */
    unsigned int excellentSamples;
};

} // namespace wkvm
