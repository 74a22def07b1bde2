#ifndef RDX_OPTIONS_HPP
#define RDX_OPTIONS_HPP

#include "rdx_config.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rdx {

// ===== Batch delay bounds =====

/**
 * @brief Resolved damage batching limits (milliseconds unless noted)
 *
 * Each field is an IntSetting looked up as batch.<name> (RDX_BATCH_<NAME>
 * in the environment) and clamped to its accepted range.
 */
struct BatchBounds {
    int min_delay = 5;
    int start_delay = 50;
    int max_delay = 500;
    int expire_delay = 15;
    int timeout_delay = 15000;
    int max_events = 50;        // events per time_unit before batching kicks in
    int time_unit = 1;          // seconds
    int history_size = 64;      // samples kept per delay history

    static const std::vector<IntSetting>& settings();

    /// Resolve every bound; never throws
    static BatchBounds resolve(const ConfigSource& source);
};

// ===== Server options =====

/**
 * @brief Immutable server settings built once at start-up
 *
 * Sessions read these concurrently; nothing mutates them afterwards.
 */
struct ServerOptions {
    std::vector<std::string> bind;          // listener URIs
    int workers = 4;

    std::string log_level = "info";
    std::string log_file;
    bool log_console = true;

    std::string auth_mode = "none";         // comma separated chain
    std::string auth_password;              // for "password"
    int auth_max_attempts = 3;
    int auth_timeout_ms = 10000;

    std::string compressor = "zlib";
    int compression_level = 1;
    int chunk_threshold = 4096;
    uint32_t max_packet_size = 256u * 1024u * 1024u;

    bool encryption_enabled = false;
    std::string encryption_key;

    bool discovery_static = false;
    std::vector<std::string> discovery_static_peers;

    BatchBounds batch;

    static std::shared_ptr<const ServerOptions> load(const ConfigSource& source);
};

/// Environment first, then the Config store
std::shared_ptr<LayeredConfigSource> default_config_source(const Config& config);

/// Split on commas, trimming blanks and dropping empty items
std::vector<std::string> split_list(const std::string& text);

/// "true", "1", "yes", "on" (case insensitive)
bool parse_bool(const std::string& text, bool default_value);

} // namespace rdx

#endif // RDX_OPTIONS_HPP
