#include "rdx_options.hpp"
#include "rdx_logger.hpp"

#include <algorithm>
#include <cctype>

namespace rdx {

const std::vector<IntSetting>& BatchBounds::settings() {
    static const std::vector<IntSetting> all = {
        {"batch.min_delay",     5,     0,  1000},
        {"batch.start_delay",   50,    1,  1000},
        {"batch.max_delay",     500,   1,  15000},
        {"batch.expire_delay",  15,    0,  10000},
        {"batch.timeout_delay", 15000, 1,  1000000},
        {"batch.max_events",    50,    10, 10000},
        {"batch.time_unit",     1,     1,  1000},
        {"batch.history_size",  64,    10, 1024},
    };
    return all;
}

BatchBounds BatchBounds::resolve(const ConfigSource& source) {
    const auto& s = settings();
    BatchBounds b;
    b.min_delay     = resolve_int_setting(source, s[0]);
    b.start_delay   = resolve_int_setting(source, s[1]);
    b.max_delay     = resolve_int_setting(source, s[2]);
    b.expire_delay  = resolve_int_setting(source, s[3]);
    b.timeout_delay = resolve_int_setting(source, s[4]);
    b.max_events    = resolve_int_setting(source, s[5]);
    b.time_unit     = resolve_int_setting(source, s[6]);
    b.history_size  = resolve_int_setting(source, s[7]);

    if (b.max_delay < b.min_delay) {
        RDX_LOG_WARN("batch.max_delay " << b.max_delay << " below batch.min_delay "
                     << b.min_delay << ", raising it");
        b.max_delay = b.min_delay;
    }
    b.start_delay = std::clamp(b.start_delay, b.min_delay, b.max_delay);
    return b;
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t comma = text.find(',', pos);
        if (comma == std::string::npos) comma = text.size();
        std::string item = text.substr(pos, comma - pos);
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t\r\n");
        if (b != std::string::npos) {
            out.push_back(item.substr(b, e - b + 1));
        }
        pos = comma + 1;
    }
    return out;
}

bool parse_bool(const std::string& text, bool default_value) {
    if (text.empty()) return default_value;
    std::string v = text;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    return default_value;
}

std::shared_ptr<LayeredConfigSource> default_config_source(const Config& config) {
    auto layered = std::make_shared<LayeredConfigSource>();
    layered->add(std::make_shared<EnvConfigSource>());
    layered->add(std::make_shared<StoreConfigSource>(config));
    return layered;
}

std::shared_ptr<const ServerOptions> ServerOptions::load(const ConfigSource& source) {
    auto opts = std::make_shared<ServerOptions>();
    auto str = [&](const std::string& key, const std::string& def) {
        auto v = source.lookup(key);
        return v ? *v : def;
    };

    opts->bind = split_list(str("server.bind", "tcp://127.0.0.1:14500"));
    opts->workers = resolve_int_setting(source, "server.workers", 4, 1, 256);

    opts->log_level = str("log.level", "info");
    opts->log_file = str("log.file", "");
    opts->log_console = parse_bool(str("log.console", "true"), true);

    opts->auth_mode = str("auth.mode", "none");
    opts->auth_password = str("auth.password", "");
    opts->auth_max_attempts = resolve_int_setting(source, "auth.max_attempts", 3, 1, 100);
    opts->auth_timeout_ms = resolve_int_setting(source, "auth.timeout_ms", 10000, 100, 600000);

    opts->compressor = str("protocol.compressor", "zlib");
    opts->compression_level = resolve_int_setting(source, "protocol.compression_level", 1, 0, 9);
    opts->chunk_threshold = resolve_int_setting(source, "protocol.chunk_threshold",
                                                4096, 0, 64 * 1024 * 1024);
    opts->max_packet_size = static_cast<uint32_t>(
        resolve_int_setting(source, "protocol.max_packet_size",
                            256 * 1024 * 1024, 1024, 1024 * 1024 * 1024));

    opts->encryption_enabled = parse_bool(str("encryption.enabled", "false"), false);
    opts->encryption_key = str("encryption.key", "");
    if (opts->encryption_enabled && opts->encryption_key.empty()) {
        RDX_LOG_WARN("encryption.enabled is set without encryption.key, disabling encryption");
        opts->encryption_enabled = false;
    }

    opts->discovery_static = parse_bool(str("discovery.static", "false"), false);
    opts->discovery_static_peers = split_list(str("discovery.static_peers", ""));

    opts->batch = BatchBounds::resolve(source);
    return opts;
}

} // namespace rdx
