#include "action_base.hpp"
#include "action_registry.hpp"
#include "../logger.hpp"
#include "../msgpack_codec.hpp"

#include <log4cplus/loggingmacros.h>

#include <memory>

namespace dombridge::actions {

namespace {

class SelectorsListAction : public ActionHandler {
public:
	const char* name() const override {
		return "selectors.list";
	}

	bool handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
		SelectorListing listing = ctx.context.selectors.list();
		if (!listing.success) {
			pack_error_response(pk, listing.error);
			return false;
		}

		pk.pack("payload");
		pk.pack_map(2);
		pk.pack("selectors");
		dombridge::codec::pack_json(pk, listing.selectors);
		pk.pack("file_path");
		pk.pack(listing.file_path);
		pk.pack("error");
		pk.pack_nil();
		return true;
	}
};

class SelectorsAddAction : public ActionHandler {
public:
	const char* name() const override {
		return "selectors.add";
	}

	bool handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
		if (!ensure_payload_map(ctx, pk)) {
			return false;
		}

		auto preset_obj = dombridge::codec::find_key(ctx.payload, "preset");
		if (!preset_obj) {
			pack_error_response(pk, "preset is required");
			return false;
		}

		std::string error;
		if (!ctx.context.selectors.add(dombridge::codec::to_json(*preset_obj), error)) {
			LOG4CPLUS_WARN(control_logger(), "selectors.add failed: " << error);
			pack_error_response(pk, error);
			return false;
		}

		pk.pack("payload");
		pk.pack_map(1);
		pk.pack("count");
		pk.pack(static_cast<uint64_t>(ctx.context.selectors.size()));
		pk.pack("error");
		pk.pack_nil();
		return true;
	}
};

class SelectorsRemoveAction : public ActionHandler {
public:
	const char* name() const override {
		return "selectors.remove";
	}

	bool handle(ActionContext& ctx, msgpack::packer<msgpack::sbuffer>& pk) override {
		std::string preset_name;
		if (!require_string(ctx, "name", pk, preset_name)) {
			return false;
		}

		if (!ctx.context.selectors.remove(preset_name)) {
			pack_error_response(pk, "Selector not found: " + preset_name);
			return false;
		}

		pk.pack("payload");
		pk.pack_map(1);
		pk.pack("count");
		pk.pack(static_cast<uint64_t>(ctx.context.selectors.size()));
		pk.pack("error");
		pk.pack_nil();
		return true;
	}
};

} // namespace

void register_selector_actions(ActionRegistry& registry) {
	registry.add(std::make_unique<SelectorsListAction>());
	registry.add(std::make_unique<SelectorsAddAction>());
	registry.add(std::make_unique<SelectorsRemoveAction>());
}

} // namespace dombridge::actions
