#include "warm_transfer/agent/script.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace warm_transfer {

namespace {

std::vector<std::string> read_list(const nlohmann::json& json,
                                   const char* key,
                                   std::vector<std::string> fallback) {
    if (!json.contains(key)) {
        return fallback;
    }
    const auto& value = json.at(key);
    if (!value.is_array()) {
        throw std::runtime_error(std::string("script field '") + key + "' must be an array");
    }
    return value.get<std::vector<std::string>>();
}

std::string read_text(const nlohmann::json& json, const char* key, std::string fallback) {
    if (!json.contains(key) || json.at(key).is_null()) {
        return fallback;
    }
    return json.at(key).get<std::string>();
}

void sort_by_priority(std::vector<TransferCriterion>& criteria) {
    std::stable_sort(criteria.begin(), criteria.end(),
                     [](const TransferCriterion& lhs, const TransferCriterion& rhs) {
                         return static_cast<int>(lhs.reason) < static_cast<int>(rhs.reason);
                     });
}

}

ScriptConfig ScriptConfig::defaults() {
    ScriptConfig script;
    script.agent_name = "Alyssa";
    script.company = "CloudAnalytics AI";
    script.product = "an AI-powered business analytics platform";
    script.greeting =
        "Hi, this is {agent} calling from {company}. You recently requested information "
        "about our platform. Is now a good time for a quick chat?";
    script.personalized_greeting =
        "Hi {name}, this is {agent} calling from {company}. You recently requested information "
        "about our platform. Is now a good time for a quick chat?";
    script.follow_up_greeting =
        "Hi {name}, this is {agent} from {company}. I wanted to follow up on our previous "
        "conversation. Is now a good time for a quick chat?";
    script.qualification_criteria = {
        "biggest challenge with data analysis today",
        "analytics tools currently in use",
        "team size and decision timeline",
    };
    script.transfer_criteria = {
        {TransferReason::ExplicitRequest,
         {"speak to someone", "talk to someone", "speak with someone", "talk with someone",
          "speak to a human", "talk to a human", "speak to a person", "talk to a person",
          "real person", "sales rep", "sales representative", "speak to a representative",
          "talk to a representative", "speak to your supervisor", "speak to a manager"}},
        {TransferReason::Pricing,
         {"pricing", "price", "prices", "how much", "cost", "costs", "quote", "demo",
          "demonstration"}},
        {TransferReason::EnterpriseTerms,
         {"enterprise", "contract", "contract terms", "sla", "volume discount", "procurement",
          "licensing", "license"}},
        {TransferReason::TechnicalQuestion,
         {"integrate", "integration", "integrations", "api", "sso", "single sign on",
          "on premise", "security review", "soc 2", "data governance", "compliance"}},
        {TransferReason::BuyingIntent,
         {"ready to buy", "want to buy", "purchase", "sign up", "get started",
          "move forward", "where do i sign"}},
        {TransferReason::Negotiation,
         {"too expensive", "discount", "budget", "cheaper", "negotiate", "better deal"}},
    };
    script.interest_phrases = {"interested", "sounds good", "sounds great", "tell me more",
                               "that would help", "we need"};
    script.competitors = {"Snowflake", "Databricks", "Sigma", "Tableau", "Power BI", "Looker"};
    script.ready_phrases = {"i'm ready", "ready now", "go ahead", "connect me", "connect them",
                            "put them through", "patch them through", "send them over",
                            "i can take it"};
    script.voicemail_phrases = {"leave a message", "after the tone", "after the beep",
                                "voicemail", "mailbox", "not available right now"};
    script.messages.hold_announcement =
        "Please hold while I connect you to a sales representative.";
    script.messages.rep_unavailable =
        "I'm sorry, I wasn't able to reach a representative right now. Let's keep going and "
        "I'll make sure someone follows up with you.";
    script.messages.apology_closing =
        "I'm sorry, I wasn't able to reach a representative right now. Someone from our team "
        "will call you back shortly. Thank you for your time, goodbye.";
    script.messages.connecting_rep = "Connecting you to the customer now.";
    script.messages.handoff =
        "You're now on the line with one of our sales representatives. I'll be hanging up now.";
    script.messages.closing = "Thank you for your time. Have a great day, goodbye.";
    script.messages.repeat_request = "Sorry, could you say that again?";
    return script;
}

ScriptConfig ScriptConfig::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::runtime_error("script must be a JSON object");
    }
    auto script = defaults();
    script.agent_name = read_text(json, "agent_name", script.agent_name);
    script.company = read_text(json, "company", script.company);
    script.product = read_text(json, "product", script.product);
    script.greeting = read_text(json, "greeting", script.greeting);
    script.personalized_greeting =
        read_text(json, "personalized_greeting", script.personalized_greeting);
    script.follow_up_greeting = read_text(json, "follow_up_greeting", script.follow_up_greeting);
    script.qualification_criteria =
        read_list(json, "qualification_criteria", script.qualification_criteria);
    script.interest_phrases = read_list(json, "interest_phrases", script.interest_phrases);
    script.competitors = read_list(json, "competitors", script.competitors);
    script.ready_phrases = read_list(json, "ready_phrases", script.ready_phrases);
    script.voicemail_phrases = read_list(json, "voicemail_phrases", script.voicemail_phrases);

    if (json.contains("transfer_criteria")) {
        const auto& items = json.at("transfer_criteria");
        if (!items.is_array()) {
            throw std::runtime_error("script field 'transfer_criteria' must be an array");
        }
        std::vector<TransferCriterion> criteria;
        for (const auto& item : items) {
            const auto name = item.at("reason").get<std::string>();
            const auto reason = parse_transfer_reason(name);
            if (!reason) {
                throw std::runtime_error("unknown transfer reason: " + name);
            }
            criteria.push_back({*reason, item.at("phrases").get<std::vector<std::string>>()});
        }
        script.transfer_criteria = std::move(criteria);
    }
    sort_by_priority(script.transfer_criteria);

    if (json.contains("messages")) {
        const auto& messages = json.at("messages");
        auto& target = script.messages;
        target.hold_announcement = read_text(messages, "hold_announcement",
                                             target.hold_announcement);
        target.rep_unavailable = read_text(messages, "rep_unavailable", target.rep_unavailable);
        target.apology_closing = read_text(messages, "apology_closing", target.apology_closing);
        target.connecting_rep = read_text(messages, "connecting_rep", target.connecting_rep);
        target.handoff = read_text(messages, "handoff", target.handoff);
        target.closing = read_text(messages, "closing", target.closing);
        target.repeat_request = read_text(messages, "repeat_request", target.repeat_request);
    }
    return script;
}

ScriptConfig ScriptConfig::load_file(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw std::runtime_error("cannot open script file: " + path.string());
    }
    return from_json(nlohmann::json::parse(stream));
}

nlohmann::json ScriptConfig::to_json() const {
    nlohmann::json criteria = nlohmann::json::array();
    for (const auto& criterion : transfer_criteria) {
        criteria.push_back({{"reason", to_string(criterion.reason)},
                            {"phrases", criterion.phrases}});
    }
    return {
        {"agent_name", agent_name},
        {"company", company},
        {"product", product},
        {"qualification_criteria", qualification_criteria},
        {"transfer_criteria", criteria},
        {"competitors", competitors},
    };
}

std::string render_template(const std::string& text,
                            const std::map<std::string, std::string>& values) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '{') {
            const auto end = text.find('}', i);
            if (end != std::string::npos) {
                const auto it = values.find(text.substr(i + 1, end - i - 1));
                if (it != values.end()) {
                    result += it->second;
                    i = end;
                    continue;
                }
            }
        }
        result.push_back(text[i]);
    }
    return result;
}

}
