#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace dombridge {

/// Originator of a command. Results are routed back by this tag.
enum class CommandSource : std::size_t {
    Ui = 0,
    Mcp = 1,
};

constexpr std::size_t kCommandSourceCount = 2;

const char* to_string(CommandSource source);
std::optional<CommandSource> parse_source(const std::string& text);

/**
 * Outbound DOM operation.
 *
 * arguments holds the action parameters (selector, text, key, ...) and is
 * forwarded without inspection.
 */
struct Command {
    std::string action;
    std::string request_id;
    CommandSource source = CommandSource::Mcp;
    nlohmann::json arguments = nlohmann::json::object();
};

/// {type:"dom_operation", action, <arguments...>, request_id, source}
nlohmann::json encode_command(const Command& command);

/// Random UUIDv4 text.
std::string mint_request_id();

/// Local time as "YYYY-MM-DD HH:MM:SS".
std::string now_timestamp();

/// ISO-8601 UTC time, used on the monitoring stream.
std::string now_iso();

// Accessors over an inbound {type:"dom_operation_result", command, result, timestamp} envelope.

/// request_id echoed in command, else a top-level request_id, else empty.
std::string result_request_id(const nlohmann::json& envelope);
std::optional<CommandSource> result_source(const nlohmann::json& envelope);
/// The result object when present, otherwise the envelope itself.
const nlohmann::json& result_body(const nlohmann::json& envelope);

} // namespace dombridge
