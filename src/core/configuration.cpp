#include "configuration.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace recycling::core {

namespace {

constexpr std::string_view UNBOUNDED_KEYWORD = "unbounded";

constexpr std::array<std::string_view, 6> LOG_LEVELS = {"trace", "debug", "info", "warn", "error", "off"};

std::runtime_error bad_key(const std::string& pool_name, std::string_view key, const std::string& detail) {
    return std::runtime_error("Pool '" + pool_name + "': " + std::string(key) + " " + detail);
}

// Non-negative integer, or `fallback` when the key is absent. With
// `allow_unbounded`, the string "unbounded" yields RecyclerConfig::UNBOUNDED.
std::size_t read_count(const toml::table& table, std::string_view key, const std::string& pool_name,
                       std::size_t fallback, bool allow_unbounded = false) {
    const toml::node* node = table.get(key);
    if (!node) {
        return fallback;
    }

    if (const auto* text = node->as_string()) {
        if (allow_unbounded && text->get() == UNBOUNDED_KEYWORD) {
            return RecyclerConfig::UNBOUNDED;
        }
        throw bad_key(pool_name, key, "must be an integer" +
                                          std::string(allow_unbounded ? " or \"unbounded\"" : "") + ", got \"" +
                                          text->get() + "\"");
    }

    const auto* integer = node->as_integer();
    if (!integer) {
        throw bad_key(pool_name, key, "must be an integer");
    }
    if (integer->get() < 0) {
        throw bad_key(pool_name, key, "must be >= 0, got " + std::to_string(integer->get()));
    }
    return static_cast<std::size_t>(integer->get());
}

std::runtime_error parse_failure(std::string_view source, const toml::parse_error& e) {
    std::ostringstream oss;
    oss << "Failed to parse TOML " << source << ": " << e;
    return std::runtime_error(oss.str());
}

}  // namespace

void SystemConfig::validate() const {
    if (std::find(LOG_LEVELS.begin(), LOG_LEVELS.end(), log_level) == LOG_LEVELS.end()) {
        throw std::runtime_error("Invalid log level: " + log_level);
    }
}

void Configuration::load_from_file(const std::filesystem::path& filepath) {
    if (!std::filesystem::exists(filepath)) {
        throw std::runtime_error("Configuration file not found: " + filepath.string());
    }

    toml::table root;
    try {
        root = toml::parse_file(filepath.string());
    } catch (const toml::parse_error& e) {
        throw parse_failure(filepath.string(), e);
    }

    apply(root);
    source_path_ = filepath;
    spdlog::info("Configuration loaded from: {} ({} pools)", filepath.string(), pools_.size());
}

void Configuration::load_from_string(std::string_view toml_content) {
    toml::table root;
    try {
        root = toml::parse(toml_content);
    } catch (const toml::parse_error& e) {
        throw parse_failure("string", e);
    }

    apply(root);
    spdlog::info("Configuration loaded from string ({} pools)", pools_.size());
}

std::optional<RecyclerConfig> Configuration::get_pool(const std::string& name) const {
    if (auto it = pools_.find(name); it != pools_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<std::string> Configuration::get_pool_names() const {
    std::vector<std::string> names;
    names.reserve(pools_.size());
    for (const auto& [name, _] : pools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void Configuration::validate() const {
    system_.validate();

    for (const auto& [name, config] : pools_) {
        try {
            config.validate();
        } catch (const std::exception& e) {
            throw std::runtime_error("Pool '" + name + "' validation failed: " + e.what());
        }
    }
}

void Configuration::clear() {
    system_ = SystemConfig{};
    pools_.clear();
    loaded_ = false;
    source_path_.clear();
}

// Replace the current settings with `root`. Leaves the object cleared if
// `root` is invalid.
void Configuration::apply(const toml::table& root) {
    clear();
    try {
        if (const auto* system = root["system"].as_table()) {
            read_system(*system);
        }
        if (const auto* pools = root["pools"].as_table()) {
            read_pools(*pools);
        }
        validate();
    } catch (...) {
        clear();
        throw;
    }
    loaded_ = true;
}

void Configuration::read_system(const toml::table& table) {
    if (auto val = table["log_level"].value<std::string>()) {
        system_.log_level = *val;
    }
    if (auto val = table["log_file"].value<std::string>()) {
        system_.log_file = *val;
    }
}

void Configuration::read_pools(const toml::table& table) {
    for (auto&& [key, value] : table) {
        if (const auto* pool_table = value.as_table()) {
            read_pool(std::string(key.str()), *pool_table);
        } else {
            spdlog::warn("Ignoring non-table entry pools.{}", key.str());
        }
    }
}

void Configuration::read_pool(const std::string& name, const toml::table& table) {
    RecyclerConfig config;

    config.max_idle = read_count(table, "max_idle", name, RecyclerConfig::DEFAULT_MAX_IDLE, true);
    config.prefill = read_count(table, "prefill", name, 0);

    pools_[name] = config;
}

Configuration& get_config() {
    static Configuration instance;
    return instance;
}

}  // namespace recycling::core
