#pragma once

#include "command_channel.hpp"
#include "request_correlator.hpp"
#include "result_router.hpp"
#include "selector_store.hpp"
#include "sse_hub.hpp"
#include "tool_catalog.hpp"
#include "tool_dispatcher.hpp"

#include <chrono>
#include <cstdint>
#include <string>

/**
 * Runtime options, filled from the command line.
 */
struct BridgeOptions {
    std::string log_config = "log4cplus.ini";
    std::string http_host = "localhost";
    int http_port = 11809;
    std::string ws_host = "localhost";
    uint16_t ws_port = 11808;
    std::string socket_path = "/tmp/dombridge.sock";
    std::string selector_file = "llmcp_selectors.json";
    std::chrono::seconds request_timeout{30};
    std::chrono::seconds sweep_interval{10};
    std::chrono::seconds stale_age{60};
    std::string tls_cert;
    std::string tls_key;
    bool enable_pdeathsig = false;
};

/**
 * State shared by the protocol server, the command channel and the control
 * socket. The transport is owned by the caller so tests can substitute it.
 */
struct BridgeContext {
    BridgeContext(dombridge::CommandTransport& transport, const std::string& selector_file);

    BridgeContext(const BridgeContext&) = delete;
    BridgeContext& operator=(const BridgeContext&) = delete;

    dombridge::CommandTransport& transport;
    dombridge::RequestCorrelator correlator;
    dombridge::UiResultBuffer ui_results;
    dombridge::ResultRouter router;
    dombridge::SelectorStore selectors;
    dombridge::ToolDispatcher dispatcher;
    dombridge::SseHub sse;
};
