#include "rdx_config.hpp"
#include "rdx_errors.hpp"
#include "rdx_logger.hpp"

#include <cctype>
#include <climits>
#include <cstdlib>

namespace rdx {

// ===== EnvConfigSource =====

EnvConfigSource::EnvConfigSource(std::string prefix)
    : prefix_(std::move(prefix)) {}

std::string EnvConfigSource::variable_name(const std::string& key) const {
    std::string name = prefix_;
    name.reserve(prefix_.size() + key.size());
    for (char c : key) {
        if (c == '.' || c == '-') {
            name.push_back('_');
        } else {
            name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return name;
}

std::optional<std::string> EnvConfigSource::lookup(const std::string& key) const {
    const char* value = std::getenv(variable_name(key).c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

// ===== MapConfigSource =====

std::optional<std::string> MapConfigSource::lookup(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

// ===== LayeredConfigSource =====

void LayeredConfigSource::add(std::shared_ptr<const ConfigSource> source) {
    if (source) layers_.push_back(std::move(source));
}

std::optional<std::string> LayeredConfigSource::lookup(const std::string& key) const {
    for (const auto& layer : layers_) {
        auto value = layer->lookup(key);
        if (value) return value;
    }
    return std::nullopt;
}

std::string LayeredConfigSource::describe() const {
    std::string out;
    for (const auto& layer : layers_) {
        if (!out.empty()) out += " > ";
        out += layer->describe();
    }
    return out.empty() ? "empty" : out;
}

// ===== Integer settings =====

long long parse_setting_integer(const std::string& key, const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    size_t end = text.find_last_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        throw ConfigParseError("empty value for " + key);
    }
    std::string trimmed = text.substr(begin, end - begin + 1);

    size_t digits_from = (trimmed[0] == '-' || trimmed[0] == '+') ? 1 : 0;
    if (digits_from == trimmed.size()) {
        throw ConfigParseError("invalid value for " + key + ": '" + text + "'");
    }
    for (size_t i = digits_from; i < trimmed.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
            throw ConfigParseError("invalid value for " + key + ": '" + text + "'");
        }
    }

    try {
        return std::stoll(trimmed);
    } catch (const std::out_of_range&) {
        // Still a number, just a huge one: let the range clamp handle it
        return trimmed[0] == '-' ? LLONG_MIN : LLONG_MAX;
    } catch (const std::invalid_argument&) {
        throw ConfigParseError("invalid value for " + key + ": '" + text + "'");
    }
}

int resolve_int_setting(const ConfigSource& source, const IntSetting& setting) {
    auto raw = source.lookup(setting.key);
    if (!raw) {
        return setting.default_value;
    }

    long long value = 0;
    try {
        value = parse_setting_integer(setting.key, *raw);
    } catch (const ConfigParseError& e) {
        RDX_LOG_WARN("Warning: " << e.what() << " (from " << source.describe()
                     << "), using default " << setting.default_value);
        return setting.default_value;
    }

    if (value < setting.min_value) {
        RDX_LOG_DEBUG(setting.key << "=" << value << " below minimum, using " << setting.min_value);
        return setting.min_value;
    }
    if (value > setting.max_value) {
        RDX_LOG_DEBUG(setting.key << "=" << value << " above maximum, using " << setting.max_value);
        return setting.max_value;
    }
    return static_cast<int>(value);
}

int resolve_int_setting(const ConfigSource& source, const std::string& key,
                        int default_value, int min_value, int max_value) {
    return resolve_int_setting(source, IntSetting{key, default_value, min_value, max_value});
}

} // namespace rdx
