#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <toml++/toml.hpp>

#include "recycler_config.hpp"

namespace recycling::core {

// [system] table: logging setup for the process
struct SystemConfig {
    std::string log_level{"info"};  // trace, debug, info, warn, error or off
    std::string log_file;           // Empty means console only

    // @throws std::runtime_error on an unknown log level
    void validate() const;
};

/**
 * @brief Pool settings loaded from TOML
 *
 * Recognized layout:
 * @code
 * [system]
 * log_level = "debug"
 * log_file  = "/var/log/recycling.log"
 *
 * [pools.frame_buffers]
 * max_idle = 256   # or "unbounded"; 0 retains nothing; omitted = DEFAULT_MAX_IDLE
 * prefill  = 32
 * @endcode
 *
 * Each `[pools.<name>]` table becomes one RecyclerConfig, looked up by name:
 * @code
 * Configuration config;
 * config.load_from_file("config/recycling.toml");
 * Recycler<Frame> frames(config.get_pool("frame_buffers").value_or(RecyclerConfig{}));
 * @endcode
 *
 * Every load replaces what was there before. A failed load throws
 * std::runtime_error naming the offending file, pool or key; a present key
 * of the wrong type is an error, never a silent default.
 */
class Configuration {
  public:
    Configuration() = default;

    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;
    Configuration(Configuration&&) = delete;
    Configuration& operator=(Configuration&&) = delete;

    void load_from_file(const std::filesystem::path& filepath);
    void load_from_string(std::string_view toml_content);

    [[nodiscard]] const SystemConfig& get_system() const noexcept {
        return system_;
    }

    // nullopt when no [pools.<name>] table was loaded
    [[nodiscard]] std::optional<RecyclerConfig> get_pool(const std::string& name) const;

    // Sorted, so iteration order does not depend on the hash map
    [[nodiscard]] std::vector<std::string> get_pool_names() const;

    [[nodiscard]] bool is_loaded() const noexcept {
        return loaded_;
    }

    // Empty unless loaded from a file
    [[nodiscard]] const std::filesystem::path& get_filepath() const noexcept {
        return source_path_;
    }

    void validate() const;
    void clear();

  private:
    void apply(const toml::table& root);
    void read_system(const toml::table& table);
    void read_pools(const toml::table& table);
    void read_pool(const std::string& name, const toml::table& table);

    SystemConfig system_;
    std::unordered_map<std::string, RecyclerConfig> pools_;

    bool loaded_{false};
    std::filesystem::path source_path_;
};

// Process-wide instance, empty until one of the load functions runs
Configuration& get_config();

}  // namespace recycling::core
