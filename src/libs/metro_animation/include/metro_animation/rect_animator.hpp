#pragma once

#include <metro_animation/frame_scheduler.hpp>
#include <metro_model/types.hpp>
#include <functional>
#include <memory>
#include <utility>

namespace metro_animation {

using RectTickFn = std::function<void(const metro_model::Rect&)>;
using DoneFn = std::function<void()>;
using EasingFn = double (*)(double);

metro_model::Rect lerp_rect(const metro_model::Rect& a, const metro_model::Rect& b, double t);

// Handle to a running animation. Invoking it (or cancel()) stops the
// animation before its next frame; on_done never fires after that. A
// default-constructed or finished token is inert.
class CancelToken {
public:
    struct State;

    CancelToken() = default;
    explicit CancelToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    void cancel();
    void operator()() { cancel(); }
    bool active() const;

private:
    std::shared_ptr<State> state_;
};

// Interpolates start -> end over duration_ms, calling on_tick once per frame
// with the eased rect and on_done once after the frame that reaches end.
// scheduler must outlive the animation.
CancelToken animate_rect(FrameScheduler& scheduler,
    const metro_model::Rect& start,
    const metro_model::Rect& end,
    double duration_ms,
    RectTickFn on_tick,
    DoneFn on_done,
    EasingFn easing = nullptr);

} // namespace metro_animation
