#include "gateway_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/un.h>

namespace sockgate {

namespace {

const char* const kEnvPrefix = "SOCKGATE_";
const char* const kWorkerEnvPrefix = "worker_env.";

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

int parse_int(const std::string& key, const std::string& value, int min_value) {
    size_t pos = 0;
    long parsed;
    try {
        parsed = std::stol(value, &pos, 10);
    } catch (const std::exception&) {
        throw ConfigError(key, "expected an integer, got '" + value + "'");
    }
    if (pos != value.size()) {
        throw ConfigError(key, "expected an integer, got '" + value + "'");
    }
    if (parsed < min_value || parsed > 1000000) {
        throw ConfigError(key, "value " + value + " out of range (minimum " +
                                   std::to_string(min_value) + ")");
    }
    return static_cast<int>(parsed);
}

bool parse_bool(const std::string& key, const std::string& value) {
    std::string v = to_lower(value);
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        return true;
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
        return false;
    }
    throw ConfigError(key, "expected a boolean, got '" + value + "'");
}

std::chrono::milliseconds parse_duration_key(const std::string& key, const std::string& value) {
    try {
        return parse_duration(value);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(key, e.what());
    }
}

mode_t parse_mode(const std::string& key, const std::string& value) {
    if (value.empty() || value.size() > 4 ||
        value.find_first_not_of("01234567") != std::string::npos) {
        throw ConfigError(key, "expected octal permission bits (e.g. 0660), got '" + value + "'");
    }
    return static_cast<mode_t>(std::stoul(value, nullptr, 8));
}

std::vector<std::string> split_words(const std::string& value) {
    std::istringstream in(value);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

std::vector<std::chrono::milliseconds> parse_schedule(const std::string& key,
                                                      const std::string& value) {
    std::vector<std::chrono::milliseconds> schedule;
    std::istringstream in(value);
    std::string item;
    while (std::getline(in, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            throw ConfigError(key, "empty entry in '" + value + "'");
        }
        schedule.push_back(parse_duration_key(key, item));
    }
    if (schedule.empty()) {
        throw ConfigError(key, "at least one delay is required");
    }
    return schedule;
}

} // anonymous namespace

std::chrono::milliseconds parse_duration(const std::string& text) {
    std::string s = trim(text);
    size_t digits = 0;
    while (digits < s.size() && std::isdigit(static_cast<unsigned char>(s[digits]))) {
        digits++;
    }
    if (digits == 0 || digits > 12) {
        throw std::invalid_argument("invalid duration '" + text + "'");
    }

    long long amount = std::stoll(s.substr(0, digits));
    std::string unit = to_lower(trim(s.substr(digits)));

    if (unit.empty() || unit == "ms") {
        return std::chrono::milliseconds(amount);
    }
    if (unit == "s") {
        return std::chrono::seconds(amount);
    }
    if (unit == "m" || unit == "min") {
        return std::chrono::minutes(amount);
    }
    throw std::invalid_argument("invalid duration unit in '" + text + "' (use ms, s or m)");
}

const std::vector<std::string>& config_keys() {
    static const std::vector<std::string> keys = {
        "listen_address", "socket_path", "socket_mode", "socket_group", "socket_backlog",
        "pool_size", "worker_command", "worker_directory",
        "restart_policy", "backoff_schedule", "max_restarts_per_window", "restart_window",
        "stability_window", "ready_timeout", "ready_notify",
        "idle_timeout", "reload_grace_period", "stop_grace_period",
        "control_address",
    };
    return keys;
}

void apply_setting(GatewayConfig& config, const std::string& key, const std::string& raw) {
    std::string value = trim(raw);

    if (key.compare(0, std::string(kWorkerEnvPrefix).size(), kWorkerEnvPrefix) == 0) {
        std::string name = key.substr(std::string(kWorkerEnvPrefix).size());
        if (name.empty() || name.find('=') != std::string::npos) {
            throw ConfigError(key, "invalid environment variable name");
        }
        config.worker_env[name] = value;
        return;
    }

    if (key == "listen_address") {
        if (value.find(':') == std::string::npos) {
            throw ConfigError(key, "expected host:port, got '" + value + "'");
        }
        config.listen_address = value;
    } else if (key == "socket_path") {
        config.socket_path = value;
    } else if (key == "socket_mode") {
        config.socket_mode = parse_mode(key, value);
    } else if (key == "socket_group") {
        config.socket_group = value;
    } else if (key == "socket_backlog") {
        config.socket_backlog = parse_int(key, value, 1);
    } else if (key == "pool_size") {
        config.pool_size = parse_int(key, value, 1);
    } else if (key == "worker_command") {
        config.worker_command = split_words(value);
    } else if (key == "worker_directory") {
        config.worker_directory = value;
    } else if (key == "restart_policy") {
        try {
            config.restart_policy.mode = parse_restart_mode(value);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(key, e.what());
        }
    } else if (key == "backoff_schedule") {
        config.restart_policy.backoff_schedule = parse_schedule(key, value);
    } else if (key == "max_restarts_per_window") {
        std::string v = to_lower(value);
        if (v.empty() || v == "none" || v == "unlimited") {
            config.restart_policy.max_restarts_per_window.reset();
        } else {
            config.restart_policy.max_restarts_per_window = parse_int(key, value, 0);
        }
    } else if (key == "restart_window") {
        config.restart_policy.restart_window = parse_duration_key(key, value);
    } else if (key == "stability_window") {
        config.stability_window = parse_duration_key(key, value);
    } else if (key == "ready_timeout") {
        config.ready_timeout = parse_duration_key(key, value);
    } else if (key == "ready_notify") {
        config.ready_notify = parse_bool(key, value);
    } else if (key == "idle_timeout") {
        config.idle_timeout = parse_duration_key(key, value);
    } else if (key == "reload_grace_period") {
        config.reload_grace_period = parse_duration_key(key, value);
    } else if (key == "stop_grace_period") {
        config.stop_grace_period = parse_duration_key(key, value);
    } else if (key == "control_address") {
        config.control_address = value;
    } else {
        throw ConfigError(key, "unknown configuration key");
    }
}

void load_config_file(GatewayConfig& config, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("", "cannot open config file " + path);
    }

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("", path + ":" + std::to_string(line_no) +
                                      ": expected 'key = value'");
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        try {
            apply_setting(config, key, value);
        } catch (const ConfigError& e) {
            throw ConfigError(e.key(), path + ":" + std::to_string(line_no) + ": " + e.message());
        }
    }
}

void apply_environment(GatewayConfig& config, const EnvLookup& lookup) {
    for (const auto& key : config_keys()) {
        std::string name = kEnvPrefix + to_upper(key);
        const char* value = lookup ? lookup(name.c_str()) : std::getenv(name.c_str());
        if (value == nullptr) {
            continue;
        }
        try {
            apply_setting(config, key, value);
        } catch (const ConfigError& e) {
            throw ConfigError(key, "from " + name + ": " + e.message());
        }
    }
}

void validate(const GatewayConfig& config) {
    if (config.pool_size < 1) {
        throw ConfigError("pool_size", "must be at least 1");
    }
    if (config.worker_command.empty()) {
        throw ConfigError("worker_command", "must not be empty");
    }
    if (config.socket_path.empty()) {
        throw ConfigError("socket_path", "must not be empty");
    }
    if (config.socket_path.size() >= sizeof(sockaddr_un::sun_path)) {
        throw ConfigError("socket_path", "longer than " +
                                             std::to_string(sizeof(sockaddr_un::sun_path) - 1) +
                                             " bytes");
    }
    if (config.listen_address.find(':') == std::string::npos) {
        throw ConfigError("listen_address", "expected host:port");
    }
    if (config.idle_timeout.count() <= 0) {
        throw ConfigError("idle_timeout", "must be positive");
    }
    if (config.ready_timeout.count() <= 0) {
        throw ConfigError("ready_timeout", "must be positive");
    }
    if (config.restart_policy.restart_window.count() <= 0) {
        throw ConfigError("restart_window", "must be positive");
    }
}

std::vector<WorkerSpec> make_worker_specs(const GatewayConfig& config) {
    std::vector<WorkerSpec> specs;
    specs.reserve(static_cast<size_t>(config.pool_size));

    for (int i = 1; i <= config.pool_size; ++i) {
        WorkerSpec spec;
        spec.id = i;
        spec.command = config.worker_command;
        spec.working_directory = config.worker_directory;
        spec.environment = config.worker_env;
        specs.push_back(std::move(spec));
    }
    return specs;
}

GatewayConfig ConfigSource::load() const {
    GatewayConfig config;
    if (!file.empty()) {
        load_config_file(config, file);
    }
    apply_environment(config, env);
    for (const auto& [key, value] : overrides) {
        apply_setting(config, key, value);
    }
    validate(config);
    return config;
}

} // namespace sockgate
