#include "llm/fragment_codec.hpp"

#include <nlohmann/json.hpp>
#include "protocol/message_json.hpp"

namespace sous::llm {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError invalid_fragment(const std::string& detail) {
    return AgentError{ErrorCategory::Protocol, "Invalid response fragment: " + detail,
                      "invalid_fragment"};
}

protocol::ToolCall decode_tool_call_delta(const json& entry) {
    protocol::ToolCall call;
    auto index = entry.find("index");
    if (index != entry.end() && index->is_number_integer()) {
        call.index = index->get<int>();
    }
    auto id = entry.find("id");
    if (id != entry.end() && id->is_string()) {
        call.id = id->get<std::string>();
    }
    auto function = entry.find("function");
    if (function != entry.end() && function->is_object()) {
        auto name = function->find("name");
        if (name != function->end() && name->is_string()) {
            call.name = name->get<std::string>();
        }
        auto arguments = function->find("arguments");
        if (arguments != function->end()) {
            // Some providers send arguments as an object instead of text.
            call.arguments = arguments->is_string() ? arguments->get<std::string>()
                                                    : arguments->dump();
        }
    }
    return call;
}

}  // namespace

core::errors::Result<protocol::Fragment> decode_fragment(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return invalid_fragment(e.what());
    }
    if (!doc.is_object()) {
        return invalid_fragment("expected a JSON object");
    }

    protocol::Fragment fragment;
    try {
        auto choices = doc.find("choices");
        if (choices != doc.end() && choices->is_array() && !choices->empty()) {
            const json& choice = choices->at(0);
            const json* body = nullptr;
            if (choice.contains("delta")) {
                body = &choice.at("delta");
            } else if (choice.contains("message")) {
                body = &choice.at("message");
            }

            if (body != nullptr && body->is_object()) {
                auto content = body->find("content");
                if (content != body->end() && content->is_string()) {
                    fragment.message.content = content->get<std::string>();
                }
                auto calls = body->find("tool_calls");
                if (calls != body->end() && calls->is_array()) {
                    std::vector<protocol::ToolCall> parsed;
                    for (const auto& entry : *calls) {
                        parsed.push_back(decode_tool_call_delta(entry));
                    }
                    fragment.message.tool_calls = std::move(parsed);
                }
            }

            auto finish = choice.find("finish_reason");
            if (finish != choice.end() && finish->is_string()) {
                fragment.finish_reason = finish->get<std::string>();
            }
        }

        auto usage = doc.find("usage");
        if (usage != doc.end() && usage->is_object()) {
            protocol::Usage parsed;
            parsed.prompt_tokens = usage->value("prompt_tokens", std::int64_t{0});
            parsed.completion_tokens = usage->value("completion_tokens", std::int64_t{0});
            fragment.usage = parsed;
        }
    } catch (const json::exception& e) {
        return invalid_fragment(e.what());
    }
    return fragment;
}

core::errors::Result<std::string> encode_request(const protocol::CompletionRequest& request,
                                                 const bool stream) {
    json body;
    body["model"] = request.model;
    body["temperature"] = request.temperature;
    if (request.max_tokens.has_value()) {
        body["max_tokens"] = request.max_tokens.value();
    }

    json messages = json::array();
    for (const auto& message : request.messages) {
        messages.push_back(protocol::message_to_json(message));
    }
    body["messages"] = messages;

    if (!request.tools.empty()) {
        json tools = json::array();
        for (const auto& tool : request.tools) {
            json parameters;
            try {
                parameters = json::parse(tool.parameters_json);
            } catch (const json::parse_error& e) {
                return AgentError{ErrorCategory::Internal,
                                  "Tool '" + tool.name + "' has an invalid schema: " + e.what(),
                                  "invalid_tool_schema"};
            }
            tools.push_back({{"type", "function"},
                             {"function",
                              {{"name", tool.name},
                               {"description", tool.description},
                               {"parameters", parameters}}}});
        }
        body["tools"] = tools;
        body["tool_choice"] = "auto";
    }

    body["stream"] = stream;
    if (stream) {
        body["stream_options"] = {{"include_usage", true}};
    }
    return body.dump();
}

}  // namespace sous::llm
