#pragma once

#include "../core_context.hpp"

#include <msgpack.hpp>

#include <string>

namespace dombridge::actions {

struct ActionContext {
	const std::string& action;
	BridgeContext& context;
	const msgpack::object& payload;
	bool has_payload;
};

/**
 * One control-socket action. handle() packs exactly two entries,
 * "payload" and "error", into the already opened response map.
 */
class ActionHandler {
public:
	virtual ~ActionHandler() = default;
	virtual const char* name() const = 0;
	virtual bool handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) = 0;

protected:
	bool ensure_payload_map(const ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk);
	void pack_error_response(msgpack::packer<msgpack::sbuffer>& pk, const std::string& error_msg);
	bool require_string(const ActionContext& ctx, const char* key, msgpack::packer<msgpack::sbuffer>& pk,
	                    std::string& out);
};

} // namespace dombridge::actions
