#pragma once

#include "command_channel.hpp"
#include "request_correlator.hpp"
#include "selector_store.hpp"
#include "tool_catalog.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace dombridge {

enum class ToolStatus {
    Ok,
    ToolError,         // extension answered success:false
    InvalidArguments,
    NoClients,
    Timeout,
    UnknownTool,
};

const char* to_string(ToolStatus status);

struct ToolOutcome {
    ToolStatus status = ToolStatus::Ok;
    nlohmann::json result = nlohmann::json::object();
    std::string error;

    bool ok() const { return status == ToolStatus::Ok; }
};

/**
 * Runs one tool call end to end.
 *
 * The calling thread is parked on the correlator's waiter until the
 * extension answers or the timeout elapses.
 */
class ToolDispatcher {
public:
    static constexpr std::chrono::seconds kDefaultTimeout{30};

    ToolDispatcher(const ToolCatalog& catalog, RequestCorrelator& correlator, CommandTransport& transport,
                   SelectorStore& selectors);

    ToolOutcome call(const std::string& tool_name, const nlohmann::json& arguments);
    ToolOutcome call(const std::string& tool_name, const nlohmann::json& arguments,
                     std::chrono::milliseconds timeout);

    void set_default_timeout(std::chrono::milliseconds timeout) { default_timeout_ = timeout; }
    std::chrono::milliseconds default_timeout() const { return default_timeout_; }

    const ToolCatalog& catalog() const { return catalog_; }
    std::uint64_t requests_processed() const { return requests_processed_.load(); }
    std::size_t pending_requests() const { return correlator_.pending_count(); }
    std::size_t extension_clients() const { return transport_.client_count(); }
    /// "Never" until the first call.
    std::string last_activity() const;

private:
    ToolOutcome call_local(const ToolDefinition& tool);
    ToolOutcome shape_result(const ToolDefinition& tool, const nlohmann::json& envelope);

    const ToolCatalog& catalog_;
    RequestCorrelator& correlator_;
    CommandTransport& transport_;
    SelectorStore& selectors_;
    std::chrono::milliseconds default_timeout_{kDefaultTimeout};

    std::atomic<std::uint64_t> requests_processed_{0};
    mutable std::mutex activity_mutex_;
    std::string last_activity_ = "Never";
};

} // namespace dombridge
