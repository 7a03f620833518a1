#include "action.hpp"

#include "action_base.hpp"
#include "action_registry.hpp"
#include "../logger.hpp"
#include "../msgpack_codec.hpp"

#include <log4cplus/loggingmacros.h>

namespace dombridge::actions {

namespace {

ActionRegistry& get_registry() {
	static ActionRegistry registry = [] {
		ActionRegistry reg;
		register_command_actions(reg);
		register_selector_actions(reg);
		register_status_actions(reg);
		return reg;
	}();

	return registry;
}

} // namespace

bool ActionHandler::ensure_payload_map(const ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) {
	if (!ctx.has_payload || ctx.payload.type != msgpack::type::MAP) {
		LOG4CPLUS_ERROR(control_logger(), ctx.action << " missing payload");
		pack_error_response(pk, "Missing payload");
		return false;
	}
	return true;
}

void ActionHandler::pack_error_response(msgpack::packer<msgpack::sbuffer>& pk, const std::string& error_msg) {
	pk.pack("payload");
	pk.pack_map(0);
	pk.pack("error");
	dombridge::codec::pack_error(pk, error_msg);
}

bool ActionHandler::require_string(const ActionContext& ctx, const char* key, msgpack::packer<msgpack::sbuffer>& pk,
                                   std::string& out) {
	if (!ensure_payload_map(ctx, pk)) {
		return false;
	}
	if (auto obj = dombridge::codec::find_key(ctx.payload, key)) {
		out = dombridge::codec::as_string(*obj, "");
	}
	if (out.empty()) {
		LOG4CPLUS_ERROR(control_logger(), ctx.action << ": " << key << " is required");
		pack_error_response(pk, std::string(key) + " is required");
		return false;
	}
	return true;
}

std::string handle_action(const std::string& request_bytes, BridgeContext& context) {
	msgpack::sbuffer buffer;
	msgpack::packer<msgpack::sbuffer> pk(&buffer);

	dombridge::codec::Request request;
	try {
		request = dombridge::codec::decode_request(request_bytes);
	} catch (const std::exception& exc) {
		LOG4CPLUS_ERROR(control_logger(), "Decode error: " << exc.what());
		pk.pack_map(4);
		pk.pack("id");
		pk.pack("");
		pk.pack("type");
		pk.pack("response");
		pk.pack("payload");
		pk.pack_map(0);
		pk.pack("error");
		dombridge::codec::pack_error(pk, std::string("Decode error: ") + exc.what());
		return std::string(buffer.data(), buffer.size());
	}

	LOG4CPLUS_INFO(control_logger(), "Control action: " << request.action << " id=" << request.id);

	pk.pack_map(4);
	pk.pack("id");
	pk.pack(request.id);
	pk.pack("type");
	pk.pack("response");

	ActionHandler* handler = get_registry().find(request.action);
	if (!handler) {
		LOG4CPLUS_WARN(control_logger(), "Unknown action: " << request.action);
		pk.pack("payload");
		pk.pack_map(0);
		pk.pack("error");
		dombridge::codec::pack_error(pk, "Unknown action");
		return std::string(buffer.data(), buffer.size());
	}

	// The handler packs into its own buffer so a throw cannot leave a half-written reply.
	msgpack::sbuffer body;
	msgpack::packer<msgpack::sbuffer> body_pk(&body);
	ActionContext ctx{request.action, context, request.payload, request.has_payload};
	try {
		handler->handle(ctx, body_pk);
		buffer.write(body.data(), body.size());
	} catch (const std::exception& exc) {
		LOG4CPLUS_ERROR(control_logger(), request.action << " failed: " << exc.what());
		pk.pack("payload");
		pk.pack_map(0);
		pk.pack("error");
		dombridge::codec::pack_error(pk, std::string("Action failed: ") + exc.what());
	}

	return std::string(buffer.data(), buffer.size());
}

} // namespace dombridge::actions
