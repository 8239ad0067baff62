#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace metro_animation {

using FrameCallback = std::function<void(double now_ms)>;
using FrameId = std::uint64_t;

// Frame pump the animations run on (one callback per rendered frame).
class FrameScheduler {
public:
    virtual ~FrameScheduler() = default;

    virtual double now_ms() const = 0;
    // Runs callback once on the next frame.
    virtual FrameId request_frame(FrameCallback callback) = 0;
    virtual void cancel_frame(FrameId id) = 0;
};

// Scheduler driven by an explicit clock. The viewer advances it with the SDL
// frame delta; tests advance it by hand.
class ManualFrameScheduler : public FrameScheduler {
public:
    explicit ManualFrameScheduler(double start_ms = 0.0) : now_ms_(start_ms) {}

    double now_ms() const override { return now_ms_; }
    FrameId request_frame(FrameCallback callback) override;
    void cancel_frame(FrameId id) override;

    // Moves the clock forward and runs the frames pending at that moment.
    // Callbacks requested while pumping run on the following advance.
    void advance(double dt_ms);
    std::size_t pending() const { return pending_.size(); }

private:
    struct Pending {
        FrameId id;
        FrameCallback callback;
    };

    double now_ms_ = 0.0;
    FrameId next_id_ = 1;
    std::vector<Pending> pending_;
};

} // namespace metro_animation
