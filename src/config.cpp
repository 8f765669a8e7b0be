#include "warm_transfer/config.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace warm_transfer {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    return value ? std::stoi(value) : fallback;
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    return value ? std::stod(value) : fallback;
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::vector<std::string> split_csv(const std::string& raw) {
    std::vector<std::string> result;
    std::stringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::map<std::string, int> parse_json_map(const std::string& raw,
                                          const std::map<std::string, int>& fallback) {
    if (raw.empty()) {
        return fallback;
    }
    auto json = nlohmann::json::parse(raw);
    if (!json.is_object()) {
        throw std::runtime_error("CODECS_PRIORITY must be a JSON object");
    }
    std::map<std::string, int> result;
    for (auto it = json.begin(); it != json.end(); ++it) {
        result[it.key()] = it.value().get<int>();
    }
    return result;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

void set_env_value(const std::string& key, const std::string& value) {
#if defined(_WIN32)
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 1);
#endif
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        value = strip_quotes(value);
        set_env_value(key, value);
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.sip_user = get_env_str("SIP_USER", "user");
    config.sip_login = get_env_str("SIP_LOGIN", config.sip_user);
    config.sip_domain = get_env_str("SIP_DOMAIN", "sip.linphone.org");
    config.sip_password = get_env_str("SIP_PASSWORD", "password");
    config.sip_caller_id = get_env_optional("SIP_CALLER_ID");
    config.sip_null_device = get_env_bool("SIP_NULL_DEVICE", true);
    config.sip_port = get_env_int("SIP_PORT", 5060);
    config.sip_max_calls = get_env_int("SIP_MAX_CALLS", 32);
    config.sip_use_tcp = get_env_bool("SIP_USE_TCP", true);
    config.sip_use_ice = get_env_bool("SIP_USE_ICE", false);
    config.sip_stun_servers = split_csv(get_env_str("SIP_STUN_SERVERS", ""));
    config.sip_proxy_servers = split_csv(get_env_str("SIP_PROXY_SERVERS", ""));
    const std::map<std::string, int> default_codecs = {{"opus/48000", 254}, {"G722/16000", 253}};
    config.codecs_priority = parse_json_map(get_env_str("CODECS_PRIORITY", ""), default_codecs);

    config.events_delay = get_env_double("EVENTS_DELAY", 0.010);
    config.async_delay = get_env_double("ASYNC_DELAY", 0.005);
    config.ua_zero_thread_cnt = get_env_bool("UA_ZERO_THREAD_CNT", true);
    config.ua_main_thread_only = get_env_bool("UA_MAIN_THREAD_ONLY", true);
    config.ec_tail_len = get_env_int("EC_TAIL_LEN", 200);
    config.audio_clock_rate = get_env_int("AUDIO_CLOCK_RATE", 16000);
    config.frame_time_usec = get_env_int("FRAME_TIME_USEC", 20000);
    config.log_level = get_env_str("LOG_LEVEL", "INFO");

    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "warm_transfer");

    config.pjsip_log_level = get_env_int("PJSIP_LOG_LEVEL", 1);
    const int default_console_level = config.log_filename ? 0 : config.pjsip_log_level;
    config.pjsip_console_log_level =
        get_env_int("PJSIP_CONSOLE_LOG_LEVEL", default_console_level);

    config.backend_url = get_env_required("BACKEND_URL");
    config.lookup_url = get_env_str("LOOKUP_URL", config.backend_url);
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");
    config.backend_request_timeout = get_env_double("BACKEND_REQUEST_TIMEOUT", 60.0);
    config.backend_connect_timeout = get_env_double("BACKEND_CONNECT_TIMEOUT", 60.0);
    config.backend_sock_read_timeout = get_env_double("BACKEND_SOCK_READ_TIMEOUT", 60.0);
    config.lookup_timeout_ms = get_env_int("LOOKUP_TIMEOUT_MS", 5000);
    config.lookup_retries = get_env_int("LOOKUP_RETRIES", 1);

    config.api_port = get_env_int("API_PORT", 8000);

    config.representative_number = get_env_required("REPRESENTATIVE_NUMBER");
    config.hold_music_path = get_env_str("HOLD_MUSIC_PATH", "");
    config.customer_dial_timeout_ms = get_env_int("CUSTOMER_DIAL_TIMEOUT_MS", 30000);
    config.rep_dial_timeout_ms = get_env_int("REP_DIAL_TIMEOUT_MS", 30000);
    config.rep_dial_attempts = get_env_int("REP_DIAL_ATTEMPTS", 1);
    config.briefing_ack_timeout_ms = get_env_int("BRIEFING_ACK_TIMEOUT_MS", 20000);
    config.briefing_generation_timeout_ms = get_env_int("BRIEFING_GENERATION_TIMEOUT_MS", 8000);
    config.resume_after_failure = get_env_bool("RESUME_AFTER_FAILURE", true);
    config.max_transfer_attempts = get_env_int("MAX_TRANSFER_ATTEMPTS", 2);
    config.user_silence_timeout_ms = get_env_int("USER_SILENCE_TIMEOUT_MS", 60000);
    config.max_qualifying_duration_ms = get_env_int("MAX_QUALIFYING_DURATION_MS", 900000);
    config.closing_grace_ms = get_env_int("CLOSING_GRACE_MS", 3000);

    if (const auto script_file = get_env_optional("SCRIPT_FILE")) {
        config.script_file = std::filesystem::path(*script_file);
        config.script = ScriptConfig::load_file(*config.script_file);
    }

    return config;
}

void Config::validate() const {
    if (sip_user.empty()) {
        throw std::runtime_error("SIP_USER is required");
    }
    if (sip_domain.empty()) {
        throw std::runtime_error("SIP_DOMAIN is required");
    }
    if (sip_password.empty()) {
        throw std::runtime_error("SIP_PASSWORD is required");
    }
    if (backend_url.empty()) {
        throw std::runtime_error("BACKEND_URL is required");
    }
    if (representative_number.empty()) {
        throw std::runtime_error("REPRESENTATIVE_NUMBER is required");
    }
    if (hold_music_path.empty()) {
        throw std::runtime_error("HOLD_MUSIC_PATH is required");
    }
    if (!std::filesystem::is_regular_file(hold_music_path)) {
        throw std::runtime_error("HOLD_MUSIC_PATH not found: " + hold_music_path);
    }
    if (sip_port <= 0) {
        throw std::runtime_error("SIP_PORT must be positive");
    }
    if (api_port <= 0) {
        throw std::runtime_error("API_PORT must be positive");
    }
    if (sip_max_calls <= 0) {
        throw std::runtime_error("SIP_MAX_CALLS must be positive");
    }
    if (customer_dial_timeout_ms <= 0 || rep_dial_timeout_ms <= 0) {
        throw std::runtime_error("dial timeouts must be positive");
    }
    if (briefing_ack_timeout_ms <= 0 || briefing_generation_timeout_ms <= 0) {
        throw std::runtime_error("briefing timeouts must be positive");
    }
    if (rep_dial_attempts <= 0) {
        throw std::runtime_error("REP_DIAL_ATTEMPTS must be positive");
    }
    if (max_transfer_attempts <= 0) {
        throw std::runtime_error("MAX_TRANSFER_ATTEMPTS must be positive");
    }
    if (audio_clock_rate <= 0 || frame_time_usec <= 0) {
        throw std::runtime_error("AUDIO_CLOCK_RATE and FRAME_TIME_USEC must be positive");
    }
    if (lookup_retries < 0) {
        throw std::runtime_error("LOOKUP_RETRIES must be zero or positive");
    }
    if (script.transfer_criteria.empty()) {
        throw std::runtime_error("script must define at least one transfer criterion");
    }
}

TransferPolicy Config::transfer_policy() const {
    TransferPolicy policy;
    policy.representative_number = representative_number;
    policy.hold_music_path = hold_music_path;
    policy.customer_dial_timeout = std::chrono::milliseconds(customer_dial_timeout_ms);
    policy.rep_dial_timeout = std::chrono::milliseconds(rep_dial_timeout_ms);
    policy.rep_dial_attempts = rep_dial_attempts;
    policy.briefing_ack_timeout = std::chrono::milliseconds(briefing_ack_timeout_ms);
    policy.briefing_generation_timeout =
        std::chrono::milliseconds(briefing_generation_timeout_ms);
    policy.resume_after_failure = resume_after_failure;
    policy.max_transfer_attempts = max_transfer_attempts;
    policy.user_silence_timeout = std::chrono::milliseconds(user_silence_timeout_ms);
    policy.max_qualifying_duration = std::chrono::milliseconds(max_qualifying_duration_ms);
    policy.closing_grace = std::chrono::milliseconds(closing_grace_ms);
    return policy;
}

SessionConfig Config::session_config() const {
    return {transfer_policy(), script};
}

}
