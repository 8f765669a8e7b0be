#include <catch2/catch_test_macros.hpp>

#include "warm_transfer/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using warm_transfer::Config;

namespace {

// Sets variables for one test and removes them afterwards.
class ScopedEnv {
public:
    ScopedEnv& set(const char* name, const std::string& value) {
        setenv(name, value.c_str(), 1);
        names_.push_back(name);
        return *this;
    }

    ~ScopedEnv() {
        for (const auto* name : names_) {
            unsetenv(name);
        }
    }

private:
    std::vector<const char*> names_;
};

// Temporary hold music file, removed on scope exit.
class HoldFile {
public:
    explicit HoldFile(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::ofstream stream(path_, std::ios::binary);
        stream << "RIFF";
    }

    ~HoldFile() { std::filesystem::remove(path_); }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

}

TEST_CASE("config loads defaults with the required variables") {
    HoldFile hold("warm_transfer_defaults_hold.wav");
    ScopedEnv env;
    env.set("BACKEND_URL", "http://backend:9000")
        .set("REPRESENTATIVE_NUMBER", "+15559990000")
        .set("HOLD_MUSIC_PATH", hold.path());

    const auto config = Config::load();
    REQUIRE(config.backend_url == "http://backend:9000");
    REQUIRE(config.lookup_url == "http://backend:9000");
    REQUIRE(config.representative_number == "+15559990000");
    REQUIRE(config.api_port == 8000);
    REQUIRE(config.rep_dial_timeout_ms == 30000);
    REQUIRE(config.briefing_ack_timeout_ms == 20000);
    REQUIRE(config.closing_grace_ms == 3000);
    REQUIRE(config.resume_after_failure);
    REQUIRE(config.codecs_priority.at("opus/48000") == 254);
    REQUIRE(config.audio_clock_rate == 16000);
    REQUIRE(config.frame_time_usec == 20000);
    REQUIRE(config.hold_music_path == hold.path());
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("missing representative number fails to load") {
    ScopedEnv env;
    env.set("BACKEND_URL", "http://backend:9000");
    unsetenv("REPRESENTATIVE_NUMBER");
    REQUIRE_THROWS(Config::load());
}

TEST_CASE("transfer knobs are read from the environment") {
    ScopedEnv env;
    env.set("BACKEND_URL", "http://backend:9000")
        .set("LOOKUP_URL", "http://crm:7000")
        .set("REPRESENTATIVE_NUMBER", "sip:sales@pbx.example.com")
        .set("REP_DIAL_TIMEOUT_MS", "15000")
        .set("REP_DIAL_ATTEMPTS", "2")
        .set("RESUME_AFTER_FAILURE", "False")
        .set("SIP_STUN_SERVERS", "stun1.example.com, ,stun2.example.com")
        .set("CODECS_PRIORITY", R"({"PCMU/8000": 200})");

    const auto config = Config::load();
    REQUIRE(config.lookup_url == "http://crm:7000");
    REQUIRE(config.rep_dial_attempts == 2);
    REQUIRE_FALSE(config.resume_after_failure);
    REQUIRE(config.sip_stun_servers ==
            std::vector<std::string>{"stun1.example.com", "stun2.example.com"});
    REQUIRE(config.codecs_priority.size() == 1);

    const auto policy = config.transfer_policy();
    REQUIRE(policy.representative_number == "sip:sales@pbx.example.com");
    REQUIRE(policy.rep_dial_timeout == std::chrono::milliseconds(15000));
    REQUIRE_FALSE(policy.resume_after_failure);
}

TEST_CASE("script file replaces the default script") {
    const auto path = std::filesystem::temp_directory_path() / "warm_transfer_config_script.json";
    {
        std::ofstream stream(path);
        stream << R"({"agent_name": "Sam", "company": "Acme Data"})";
    }
    ScopedEnv env;
    env.set("BACKEND_URL", "http://backend:9000")
        .set("REPRESENTATIVE_NUMBER", "+15559990000")
        .set("SCRIPT_FILE", path.string());

    const auto config = Config::load();
    std::filesystem::remove(path);
    REQUIRE(config.script.agent_name == "Sam");
    REQUIRE(config.session_config().script.company == "Acme Data");
}

TEST_CASE("hold music must be configured and present") {
    ScopedEnv env;
    env.set("BACKEND_URL", "http://backend:9000")
        .set("REPRESENTATIVE_NUMBER", "+15559990000");
    unsetenv("HOLD_MUSIC_PATH");

    auto config = Config::load();
    REQUIRE(config.hold_music_path.empty());
    REQUIRE_THROWS_WITH(config.validate(), "HOLD_MUSIC_PATH is required");

    config.hold_music_path =
        (std::filesystem::temp_directory_path() / "warm_transfer_missing_hold.wav").string();
    REQUIRE_THROWS_WITH(config.validate(),
                        "HOLD_MUSIC_PATH not found: " + config.hold_music_path);
}

TEST_CASE("validate rejects nonsensical values") {
    HoldFile hold("warm_transfer_validate_hold.wav");
    ScopedEnv env;
    env.set("BACKEND_URL", "http://backend:9000")
        .set("REPRESENTATIVE_NUMBER", "+15559990000")
        .set("HOLD_MUSIC_PATH", hold.path());
    auto config = Config::load();
    REQUIRE_NOTHROW(config.validate());

    auto bad = config;
    bad.rep_dial_timeout_ms = 0;
    REQUIRE_THROWS(bad.validate());

    bad = config;
    bad.max_transfer_attempts = 0;
    REQUIRE_THROWS(bad.validate());

    bad = config;
    bad.frame_time_usec = 0;
    REQUIRE_THROWS(bad.validate());

    bad = config;
    bad.script.transfer_criteria.clear();
    REQUIRE_THROWS(bad.validate());
}
