#include "action_base.hpp"
#include "action_registry.hpp"

#include <memory>

namespace dombridge::actions {

namespace {

class StatusGetAction : public ActionHandler {
public:
	const char* name() const override {
		return "status.get";
	}

	bool handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
		BridgeContext& bridge = ctx.context;

		pk.pack("payload");
		pk.pack_map(6);
		pk.pack("extension_clients");
		pk.pack(static_cast<uint64_t>(bridge.dispatcher.extension_clients()));
		pk.pack("pending_requests");
		pk.pack(static_cast<uint64_t>(bridge.dispatcher.pending_requests()));
		pk.pack("requests_processed");
		pk.pack(bridge.dispatcher.requests_processed());
		pk.pack("unmatched_results");
		pk.pack(bridge.correlator.unmatched_count());
		pk.pack("sse_subscribers");
		pk.pack(static_cast<uint64_t>(bridge.sse.subscriber_count()));
		pk.pack("last_activity");
		pk.pack(bridge.dispatcher.last_activity());
		pk.pack("error");
		pk.pack_nil();
		return true;
	}
};

} // namespace

void register_status_actions(ActionRegistry& registry) {
	registry.add(std::make_unique<StatusGetAction>());
}

} // namespace dombridge::actions
