#include "request_correlator.hpp"

#include "command.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace dombridge {

namespace {

bool has_any_key(const nlohmann::json& body, std::initializer_list<const char*> keys) {
    if (!body.is_object()) {
        return false;
    }
    for (const char* key : keys) {
        if (body.contains(key)) {
            return true;
        }
    }
    return false;
}

std::string short_id(const std::string& id) {
    return id.substr(0, 8);
}

} // namespace

const char* to_string(RequestState state) {
    switch (state) {
        case RequestState::Created:
            return "CREATED";
        case RequestState::Sent:
            return "SENT";
        case RequestState::Matched:
            return "MATCHED";
        case RequestState::TimedOut:
            return "TIMED_OUT";
        case RequestState::Cancelled:
            return "CANCELLED";
    }
    return "UNKNOWN";
}

PendingWaiter::PendingWaiter(std::string id, std::future<Resolution> future)
    : id_(std::move(id)), future_(std::move(future)) {}

std::optional<Resolution> PendingWaiter::wait_for(std::chrono::milliseconds timeout) {
    if (!future_.valid()) {
        return std::nullopt;
    }
    if (future_.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return future_.get();
}

Resolution PendingWaiter::get() {
    return future_.get();
}

bool result_fits_tool(const nlohmann::json& envelope, const std::string& tool_name) {
    const nlohmann::json& body = result_body(envelope);

    if (tool_name == "get_page_info") {
        return has_any_key(body, {"url", "title"});
    }
    if (tool_name == "get_element_text") {
        return has_any_key(body, {"text", "element", "elementInfo", "content"});
    }
    if (tool_name == "get_last_clicked_element") {
        return has_any_key(body, {"element"});
    }
    if (tool_name == "find_element") {
        return has_any_key(body, {"element", "elements", "found", "count"});
    }
    if (tool_name == "click_element" || tool_name == "input_text" || tool_name == "send_key") {
        return has_any_key(body, {"success"});
    }
    return false;
}

RequestCorrelator::RequestCorrelator(Clock::duration sweep_grace)
    : sweep_grace_(sweep_grace) {}

PendingWaiter RequestCorrelator::track(const std::string& id, const std::string& tool_name,
                                       std::chrono::milliseconds wait) {
    if (id.empty()) {
        throw std::logic_error("request id must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.count(id) != 0) {
        throw std::logic_error("request id already tracked: " + id);
    }

    PendingRequest request;
    request.id = id;
    request.tool_name = tool_name;
    request.created_at = Clock::now();
    request.wait = wait;
    std::future<Resolution> future = request.promise.get_future();

    pending_.emplace(id, std::move(request));
    order_.push_back(id);

    LOG4CPLUS_DEBUG(mcp_logger(), "Tracking " << tool_name << " request " << short_id(id));
    return PendingWaiter(id, std::move(future));
}

bool RequestCorrelator::mark_sent(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return false;
    }
    if (it->second.state == RequestState::Created) {
        it->second.state = RequestState::Sent;
    }
    return true;
}

ResolveOutcome RequestCorrelator::resolve(const nlohmann::json& envelope) {
    std::string request_id = result_request_id(envelope);

    std::lock_guard<std::mutex> lock(mutex_);

    if (!request_id.empty()) {
        auto it = pending_.find(request_id);
        if (it == pending_.end()) {
            log_unmatched_locked(request_id, "no pending request with this id");
            return ResolveOutcome::Unmatched;
        }
        LOG4CPLUS_INFO(mcp_logger(), "Matched response for request " << short_id(request_id));
        Resolution resolution;
        resolution.state = RequestState::Matched;
        resolution.envelope = envelope;
        finish_locked(it, std::move(resolution));
        return ResolveOutcome::Direct;
    }

    if (order_.empty()) {
        log_unmatched_locked(request_id, "nothing pending");
        return ResolveOutcome::Unmatched;
    }

    auto oldest = pending_.find(order_.front());
    if (oldest == pending_.end()) {
        log_unmatched_locked(request_id, "oldest entry already gone");
        return ResolveOutcome::Unmatched;
    }
    if (!result_fits_tool(envelope, oldest->second.tool_name)) {
        log_unmatched_locked(request_id, "shape does not fit oldest pending tool");
        return ResolveOutcome::Unmatched;
    }

    LOG4CPLUS_WARN(mcp_logger(), "FIFO matched id-less response to " << oldest->second.tool_name
                                 << " request " << short_id(oldest->first));
    Resolution resolution;
    resolution.state = RequestState::Matched;
    resolution.envelope = envelope;
    finish_locked(oldest, std::move(resolution));
    return ResolveOutcome::Fifo;
}

bool RequestCorrelator::expire(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return false;
    }
    LOG4CPLUS_WARN(mcp_logger(), "Request " << short_id(id) << " (" << it->second.tool_name << ") timed out");
    Resolution resolution;
    resolution.state = RequestState::TimedOut;
    finish_locked(it, std::move(resolution));
    return true;
}

bool RequestCorrelator::cancel(const std::string& id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return false;
    }
    LOG4CPLUS_DEBUG(mcp_logger(), "Request " << short_id(id) << " cancelled: " << reason);
    Resolution resolution;
    resolution.state = RequestState::Cancelled;
    resolution.reason = reason;
    finish_locked(it, std::move(resolution));
    return true;
}

std::size_t RequestCorrelator::sweep(Clock::duration max_age) {
    const auto now = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> stale;
    for (const auto& entry : pending_) {
        Clock::duration threshold = max_age;
        if (entry.second.wait > Clock::duration::zero()) {
            threshold = std::max(threshold, entry.second.wait + sweep_grace_);
        }
        if (now - entry.second.created_at >= threshold) {
            stale.push_back(entry.first);
        }
    }

    for (const auto& id : stale) {
        auto it = pending_.find(id);
        LOG4CPLUS_WARN(mcp_logger(), "Sweeping stale request " << short_id(id) << " (" << it->second.tool_name
                                     << ", state " << to_string(it->second.state) << ")");
        Resolution resolution;
        resolution.state = RequestState::Cancelled;
        resolution.reason = "stale request swept";
        finish_locked(it, std::move(resolution));
    }
    return stale.size();
}

std::size_t RequestCorrelator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::optional<RequestState> RequestCorrelator::state_of(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

void RequestCorrelator::finish_locked(PendingMap::iterator it, Resolution resolution) {
    std::promise<Resolution> promise = std::move(it->second.promise);
    order_.erase(std::remove(order_.begin(), order_.end(), it->first), order_.end());
    pending_.erase(it);
    promise.set_value(std::move(resolution));
}

void RequestCorrelator::log_unmatched_locked(const std::string& request_id, const char* why) {
    unmatched_.fetch_add(1);

    std::ostringstream ids;
    for (const auto& id : order_) {
        ids << ' ' << short_id(id);
    }
    LOG4CPLUS_WARN(mcp_logger(), "Unmatched response (request_id: " << (request_id.empty() ? "<none>" : request_id)
                                 << "): " << why << "; pending:" << (order_.empty() ? " <none>" : ids.str()));
}

} // namespace dombridge
