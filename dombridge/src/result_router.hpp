#pragma once

#include "command.hpp"
#include "request_correlator.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <deque>
#include <functional>
#include <limits>
#include <mutex>
#include <vector>

namespace dombridge {

/// Results of operator-issued commands, held until the control surface fetches them.
class UiResultBuffer {
public:
    explicit UiResultBuffer(std::size_t capacity = 256);

    /// Appends envelope, dropping the oldest entry when full.
    void push(nlohmann::json envelope);
    std::vector<nlohmann::json> drain(std::size_t max = std::numeric_limits<std::size_t>::max());
    std::size_t size() const;

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<nlohmann::json> results_;
};

/**
 * Delivers each inbound result to the originator named by its echoed source.
 *
 * Results without a recognised source go to the correlator, whose FIFO
 * fallback handles id-less replies.
 */
class ResultRouter {
public:
    using Sink = std::function<void(const nlohmann::json& envelope)>;

    ResultRouter(RequestCorrelator& correlator, UiResultBuffer& ui_results);

    void route(const nlohmann::json& envelope);

private:
    std::array<Sink, kCommandSourceCount> sinks_;
};

} // namespace dombridge
