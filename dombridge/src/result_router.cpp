#include "result_router.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace dombridge {

UiResultBuffer::UiResultBuffer(std::size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

void UiResultBuffer::push(nlohmann::json envelope) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (results_.size() >= capacity_) {
        results_.pop_front();
        LOG4CPLUS_WARN(control_logger(), "UI result buffer full, dropped oldest result");
    }
    results_.push_back(std::move(envelope));
}

std::vector<nlohmann::json> UiResultBuffer::drain(std::size_t max) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<nlohmann::json> out;
    while (!results_.empty() && out.size() < max) {
        out.push_back(std::move(results_.front()));
        results_.pop_front();
    }
    return out;
}

std::size_t UiResultBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

ResultRouter::ResultRouter(RequestCorrelator& correlator, UiResultBuffer& ui_results) {
    sinks_[static_cast<std::size_t>(CommandSource::Ui)] = [&ui_results](const nlohmann::json& envelope) {
        ui_results.push(envelope);
    };
    sinks_[static_cast<std::size_t>(CommandSource::Mcp)] = [&correlator](const nlohmann::json& envelope) {
        correlator.resolve(envelope);
    };
}

void ResultRouter::route(const nlohmann::json& envelope) {
    CommandSource source = result_source(envelope).value_or(CommandSource::Mcp);
    LOG4CPLUS_DEBUG(core_logger(), "Routing result to " << to_string(source));
    sinks_[static_cast<std::size_t>(source)](envelope);
}

} // namespace dombridge
