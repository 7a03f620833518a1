#include "core_context.hpp"

BridgeContext::BridgeContext(dombridge::CommandTransport& transport_ref, const std::string& selector_file)
    : transport(transport_ref),
      router(correlator, ui_results),
      selectors(selector_file),
      dispatcher(dombridge::ToolCatalog::builtin(), correlator, transport_ref, selectors) {}
