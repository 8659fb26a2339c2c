#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "register_types.hpp"
#include "session_config.hpp"
#include <string>
#include <vector>

/**
 * @struct LoadedConfig
 * @brief Everything read from a configuration file.
 *
 * @c registers is empty when the file does not define its own register map.
 */
struct LoadedConfig {
    SessionConfig session;
    std::vector<RegisterDescriptor> registers;
};

/**
 * @class ConfigLoader
 * @brief Parses the YAML configuration into session settings and register descriptors.
 *
 * This class uses the yaml-cpp library. Missing options keep the defaults of
 * SessionConfig.
 */
class ConfigLoader {
public:
    /**
     * @brief Loads and parses a YAML configuration file.
     * @param filename The path to the YAML configuration file.
     * @return The parsed configuration.
     * @throw ConfigError if the file cannot be read, is malformed or holds invalid values.
     */
    static LoadedConfig loadConfig(const std::string& filename);

    /**
     * @brief Parses a YAML document held in memory.
     * @throw ConfigError as loadConfig().
     */
    static LoadedConfig parseConfig(const std::string& yaml_text);

    /**
     * @brief Checks the settings for values no session can work with.
     * @throw ConfigError naming the offending option.
     */
    static void validate(const SessionConfig& config);
};

#endif // CONFIG_LOADER_H
