#include "tool_dispatcher.hpp"

#include "command.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <iomanip>
#include <optional>
#include <sstream>

namespace dombridge {

namespace {

std::string format_seconds(std::chrono::steady_clock::duration elapsed) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << std::chrono::duration<double>(elapsed).count() << "s";
    return out.str();
}

std::string string_field(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return "";
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // namespace

const char* to_string(ToolStatus status) {
    switch (status) {
        case ToolStatus::Ok:
            return "ok";
        case ToolStatus::ToolError:
            return "tool_error";
        case ToolStatus::InvalidArguments:
            return "invalid_arguments";
        case ToolStatus::NoClients:
            return "no_clients";
        case ToolStatus::Timeout:
            return "timeout";
        case ToolStatus::UnknownTool:
            return "unknown_tool";
    }
    return "unknown";
}

ToolDispatcher::ToolDispatcher(const ToolCatalog& catalog, RequestCorrelator& correlator,
                               CommandTransport& transport, SelectorStore& selectors)
    : catalog_(catalog), correlator_(correlator), transport_(transport), selectors_(selectors) {}

std::string ToolDispatcher::last_activity() const {
    std::lock_guard<std::mutex> lock(activity_mutex_);
    return last_activity_;
}

ToolOutcome ToolDispatcher::call(const std::string& tool_name, const nlohmann::json& arguments) {
    return call(tool_name, arguments, default_timeout_);
}

ToolOutcome ToolDispatcher::call(const std::string& tool_name, const nlohmann::json& arguments,
                                 std::chrono::milliseconds timeout) {
    ToolOutcome outcome;

    const ToolDefinition* tool = catalog_.find(tool_name);
    if (!tool) {
        LOG4CPLUS_WARN(mcp_logger(), "Unknown tool: " << tool_name);
        outcome.status = ToolStatus::UnknownTool;
        outcome.error = "Unknown tool: " + tool_name;
        return outcome;
    }

    requests_processed_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(activity_mutex_);
        last_activity_ = now_timestamp();
    }

    if (tool->local) {
        return call_local(*tool);
    }

    const nlohmann::json args = arguments.is_object() ? arguments : nlohmann::json::object();
    for (const auto& name : tool->required_arguments()) {
        auto it = args.find(name);
        if (it == args.end() || !it->is_string()) {
            outcome.status = ToolStatus::InvalidArguments;
            outcome.error = "Missing required argument '" + name + "' for " + tool_name;
            LOG4CPLUS_WARN(mcp_logger(), outcome.error);
            return outcome;
        }
    }

    Command command;
    command.action = tool->action;
    command.request_id = mint_request_id();
    command.source = CommandSource::Mcp;
    command.arguments = args;

    LOG4CPLUS_INFO(mcp_logger(), "Tool: " << tool_name << ", Request ID: " << command.request_id.substr(0, 8));

    const auto started = std::chrono::steady_clock::now();
    PendingWaiter waiter = correlator_.track(command.request_id, tool_name, timeout);

    if (!transport_.broadcast(encode_command(command))) {
        correlator_.cancel(command.request_id, "no clients");
        outcome.status = ToolStatus::NoClients;
        outcome.error = "No extension clients connected";
        LOG4CPLUS_WARN(mcp_logger(), outcome.error << " for " << tool_name);
        return outcome;
    }
    correlator_.mark_sent(command.request_id);
    LOG4CPLUS_DEBUG(mcp_logger(), "Command sent, waiting for response...");

    std::optional<Resolution> resolution = waiter.wait_for(timeout);
    if (!resolution) {
        if (!correlator_.expire(command.request_id)) {
            LOG4CPLUS_DEBUG(mcp_logger(), "Result for " << tool_name << " arrived at the deadline");
        }
        // Either way the request is terminal now, so this does not block.
        resolution = waiter.get();
    }

    switch (resolution->state) {
        case RequestState::Matched:
            return shape_result(*tool, resolution->envelope);
        case RequestState::TimedOut: {
            std::string elapsed = format_seconds(std::chrono::steady_clock::now() - started);
            outcome.status = ToolStatus::Timeout;
            outcome.error = "Request timeout - extension did not respond to " + tool_name + " within " + elapsed;
            LOG4CPLUS_WARN(mcp_logger(), outcome.error);
            return outcome;
        }
        case RequestState::Cancelled:
        case RequestState::Created:
        case RequestState::Sent:
            break;
    }

    outcome.status = ToolStatus::ToolError;
    outcome.error = "Request cancelled: " + (resolution->reason.empty() ? std::string("unknown") : resolution->reason);
    LOG4CPLUS_WARN(mcp_logger(), outcome.error);
    return outcome;
}

ToolOutcome ToolDispatcher::call_local(const ToolDefinition& tool) {
    ToolOutcome outcome;
    SelectorListing listing = selectors_.list();
    if (!listing.success) {
        outcome.status = ToolStatus::ToolError;
        outcome.error = listing.error;
        outcome.result = listing.to_json();
        LOG4CPLUS_WARN(mcp_logger(), tool.name << ": " << listing.error);
        return outcome;
    }
    outcome.result = listing.to_json();
    LOG4CPLUS_INFO(mcp_logger(), "Local result: " << listing.selectors.size() << " selectors found");
    return outcome;
}

ToolOutcome ToolDispatcher::shape_result(const ToolDefinition& tool, const nlohmann::json& envelope) {
    ToolOutcome outcome;
    const nlohmann::json& body = result_body(envelope);

    LOG4CPLUS_DEBUG(mcp_logger(), "Response received: " << body.dump().substr(0, 200));

    if (!body.is_object()) {
        outcome.status = ToolStatus::ToolError;
        outcome.error = "Invalid response format";
        return outcome;
    }

    auto success = body.find("success");
    if (success != body.end() && success->is_boolean() && !success->get<bool>()) {
        outcome.status = ToolStatus::ToolError;
        outcome.error = string_field(body, "error");
        if (outcome.error.empty()) {
            outcome.error = "Unknown error";
        }
        outcome.result = body;
        return outcome;
    }

    if (tool.name == "get_element_text") {
        nlohmann::json element_info = nlohmann::json::object();
        auto info = body.find("elementInfo");
        if (info != body.end() && info->is_object()) {
            element_info = *info;
        }

        std::string text;
        if (body.contains("text")) {
            text = string_field(body, "text");
        } else {
            text = string_field(element_info, "innerText");
            if (text.empty()) {
                text = string_field(element_info, "textContent");
            }
        }
        outcome.result = {{"success", true}, {"text", text}, {"element_info", element_info}};
        return outcome;
    }

    outcome.result = body;
    return outcome;
}

} // namespace dombridge
