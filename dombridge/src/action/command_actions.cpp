#include "action_base.hpp"
#include "action_registry.hpp"
#include "../command.hpp"
#include "../logger.hpp"
#include "../msgpack_codec.hpp"

#include <log4cplus/loggingmacros.h>

#include <chrono>
#include <limits>
#include <memory>

namespace dombridge::actions {

namespace {

// Sends an operator command to every extension. The result is collected later with results.fetch.
class CommandSendAction : public ActionHandler {
public:
	const char* name() const override {
		return "command.send";
	}

	bool handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
		Command command;
		if (!require_string(ctx, "action", pk, command.action)) {
			return false;
		}

		command.arguments = nlohmann::json::object();
		if (auto args = dombridge::codec::find_key(ctx.payload, "arguments")) {
			nlohmann::json parsed = dombridge::codec::to_json(*args);
			if (!parsed.is_object()) {
				pack_error_response(pk, "arguments must be a map");
				return false;
			}
			command.arguments = std::move(parsed);
		}
		if (auto id = dombridge::codec::find_key(ctx.payload, "request_id")) {
			command.request_id = dombridge::codec::as_string(*id, "");
		}
		if (command.request_id.empty()) {
			command.request_id = mint_request_id();
		}
		command.source = CommandSource::Ui;

		if (!ctx.context.transport.broadcast(encode_command(command))) {
			LOG4CPLUS_WARN(control_logger(), "command.send " << command.action << ": no extension clients");
			pack_error_response(pk, "No extension clients connected");
			return false;
		}

		LOG4CPLUS_INFO(control_logger(), "Sent " << command.action << " request_id=" << command.request_id);
		pk.pack("payload");
		pk.pack_map(2);
		pk.pack("success");
		pk.pack(true);
		pk.pack("request_id");
		pk.pack(command.request_id);
		pk.pack("error");
		pk.pack_nil();
		return true;
	}
};

class ResultsFetchAction : public ActionHandler {
public:
	const char* name() const override {
		return "results.fetch";
	}

	bool handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
		std::size_t max = std::numeric_limits<std::size_t>::max();
		if (ctx.has_payload && ctx.payload.type == msgpack::type::MAP) {
			if (auto value = dombridge::codec::find_key(ctx.payload, "max")) {
				int64_t requested = dombridge::codec::as_int64(*value, 0);
				if (requested > 0) {
					max = static_cast<std::size_t>(requested);
				}
			}
		}

		std::vector<nlohmann::json> results = ctx.context.ui_results.drain(max);

		pk.pack("payload");
		pk.pack_map(2);
		pk.pack("results");
		pk.pack_array(static_cast<uint32_t>(results.size()));
		for (const auto& envelope : results) {
			dombridge::codec::pack_json(pk, envelope);
		}
		pk.pack("remaining");
		pk.pack(static_cast<uint64_t>(ctx.context.ui_results.size()));
		pk.pack("error");
		pk.pack_nil();
		return true;
	}
};

// Runs a tool exactly as tools/call would, blocking the worker until it resolves.
class ToolCallAction : public ActionHandler {
public:
	const char* name() const override {
		return "tool.call";
	}

	bool handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
		std::string tool_name;
		if (!require_string(ctx, "name", pk, tool_name)) {
			return false;
		}

		nlohmann::json arguments = nlohmann::json::object();
		if (auto args = dombridge::codec::find_key(ctx.payload, "arguments")) {
			arguments = dombridge::codec::to_json(*args);
		}

		std::chrono::milliseconds timeout = ctx.context.dispatcher.default_timeout();
		if (auto value = dombridge::codec::find_key(ctx.payload, "timeout_ms")) {
			int64_t requested = dombridge::codec::as_int64(*value, 0);
			if (requested > 0) {
				timeout = std::chrono::milliseconds(requested);
			}
		}

		ToolOutcome outcome = ctx.context.dispatcher.call(tool_name, arguments, timeout);

		pk.pack("payload");
		pk.pack_map(3);
		pk.pack("success");
		pk.pack(outcome.ok());
		pk.pack("status");
		pk.pack(std::string(to_string(outcome.status)));
		pk.pack("result");
		dombridge::codec::pack_json(pk, outcome.result);
		pk.pack("error");
		if (outcome.ok()) {
			pk.pack_nil();
		} else {
			dombridge::codec::pack_error(pk, outcome.error);
		}
		return outcome.ok();
	}
};

} // namespace

void register_command_actions(ActionRegistry& registry) {
	registry.add(std::make_unique<CommandSendAction>());
	registry.add(std::make_unique<ResultsFetchAction>());
	registry.add(std::make_unique<ToolCallAction>());
}

} // namespace dombridge::actions
