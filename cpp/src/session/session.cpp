#include "poly_scatter/session/session.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace poly_scatter {

Session::Session(
    const Catalogue& catalogue,
    const CanvasBounds& canvas,
    const SessionConfig& config,
    Renderer& renderer,
    const Clock& clock
)
    : templates_(catalogue.outlines())
    , canvas_(canvas)
    , config_(config)
    , renderer_(renderer)
    , clock_(clock)
    , rng_(config.seed)
    , oracle_(config.overlap)
    , search_(oracle_, clock_, config.search)
{
    if (templates_.empty()) {
        throw std::invalid_argument("Session: catalogue is empty");
    }
    if (config_.colors.empty()) {
        throw std::invalid_argument("Session: no colors to pick from");
    }
    if (!(config_.scale > 0.0) || !std::isfinite(config_.scale)) {
        throw std::invalid_argument("Session: scale must be positive");
    }
    if (!(config_.duration_seconds > 0.0) || !std::isfinite(config_.duration_seconds)) {
        throw std::invalid_argument("Session: duration must be positive");
    }
    // Deadlines are clock ticks; longer durations would overflow them
    const double max_seconds = std::chrono::duration<double>(Clock::Duration::max()).count() / 2.0;
    if (config_.duration_seconds > max_seconds) {
        throw std::invalid_argument("Session: duration too long");
    }
}

void Session::start() {
    if (started_) return;
    started_ = true;
    started_at_ = clock_.now();
    deadline_ = started_at_ + std::chrono::duration_cast<Clock::Duration>(
        std::chrono::duration<double>(config_.duration_seconds));
}

bool Session::time_remaining() const {
    return started_ && !finished_ && clock_.now() <= deadline_;
}

double Session::elapsed_seconds() const {
    return started_ ? clock_.seconds_since(started_at_) : 0.0;
}

StepOutcome Session::step() {
    if (finished_) {
        throw std::logic_error("Session: step() after finish()");
    }
    start();

    const OutlinePtr& outline = templates_[rng_.index(templates_.size())];
    const Color color = config_.colors[rng_.index(config_.colors.size())];

    StepOutcome outcome;
    outcome.shape = outline->name();
    outcome.color = color;
    outcome.result = search_.try_place(outline, color, config_.scale, canvas_, registry_, deadline_, rng_);
    summary_.attempts += static_cast<uint64_t>(outcome.result.attempts);

    if (outcome.result.accepted()) {
        registry_.add(*outcome.result.placement);
        summary_.placed = registry_.size();
        renderer_.draw(registry_.back(), registry_.size());
        return outcome;
    }

    if (outcome.result.reason == RejectReason::Deadline) {
        ++summary_.rejected_deadline;
    } else {
        ++summary_.rejected_exhausted;
    }
    if (config_.verbose) {
        std::cerr << "[Session] Could not place shape: " << outcome.shape
                  << " (" << to_string(outcome.result.reason) << ")\n";
    }
    return outcome;
}

SessionSummary Session::run() {
    start();
    while (time_remaining()) {
        (void)step();
    }
    return finish();
}

const SessionSummary& Session::finish() {
    if (finished_) {
        return summary_;
    }
    start();
    finished_ = true;
    summary_.elapsed_seconds = clock_.seconds_since(started_at_);
    summary_.placed = registry_.size();
    summary_.overlap = oracle_.stats();
    renderer_.finish(summary_);
    return summary_;
}

}  // namespace poly_scatter
