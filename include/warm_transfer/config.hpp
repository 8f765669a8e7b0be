#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "warm_transfer/agent/script.hpp"

namespace warm_transfer {

// Timing and retry knobs of one transfer session.
struct TransferPolicy {
    std::string representative_number;
    std::string hold_music_path;
    std::chrono::milliseconds customer_dial_timeout{30000};
    std::chrono::milliseconds rep_dial_timeout{30000};
    int rep_dial_attempts = 1;
    std::chrono::milliseconds briefing_ack_timeout{20000};
    std::chrono::milliseconds briefing_generation_timeout{8000};
    bool resume_after_failure = true;
    int max_transfer_attempts = 2;
    std::chrono::milliseconds user_silence_timeout{60000};
    std::chrono::milliseconds max_qualifying_duration{900000};
    std::chrono::milliseconds closing_grace{3000};
};

// Immutable per-session snapshot handed to a session at creation.
struct SessionConfig {
    TransferPolicy policy;
    ScriptConfig script;
};

struct Config {
    std::string sip_user;
    std::string sip_login;
    std::string sip_domain;
    std::string sip_password;
    std::optional<std::string> sip_caller_id;
    bool sip_null_device = true;
    int sip_port = 5060;
    int sip_max_calls = 32;
    bool sip_use_tcp = true;
    bool sip_use_ice = false;
    std::vector<std::string> sip_stun_servers;
    std::vector<std::string> sip_proxy_servers;
    std::map<std::string, int> codecs_priority;
    double events_delay = 0.010;
    double async_delay = 0.005;
    bool ua_zero_thread_cnt = true;
    bool ua_main_thread_only = true;
    int ec_tail_len = 200;
    // Format of the PCM stream exchanged with the speech backend.
    int audio_clock_rate = 16000;
    int frame_time_usec = 20000;
    int pjsip_log_level = 1;
    int pjsip_console_log_level = 1;

    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "warm_transfer";

    std::string backend_url;
    std::string lookup_url;
    std::optional<std::string> authorization_token;
    double backend_request_timeout = 60.0;
    double backend_connect_timeout = 60.0;
    double backend_sock_read_timeout = 60.0;
    int lookup_timeout_ms = 5000;
    int lookup_retries = 1;

    int api_port = 8000;

    std::string representative_number;
    std::string hold_music_path;
    int customer_dial_timeout_ms = 30000;
    int rep_dial_timeout_ms = 30000;
    int rep_dial_attempts = 1;
    int briefing_ack_timeout_ms = 20000;
    int briefing_generation_timeout_ms = 8000;
    bool resume_after_failure = true;
    int max_transfer_attempts = 2;
    int user_silence_timeout_ms = 60000;
    int max_qualifying_duration_ms = 900000;
    int closing_grace_ms = 3000;

    std::optional<std::filesystem::path> script_file;
    ScriptConfig script = ScriptConfig::defaults();

    static Config load();
    void validate() const;

    TransferPolicy transfer_policy() const;
    SessionConfig session_config() const;
};

}
