#include <metro_animation/rect_animator.hpp>
#include <metro_animation/easing.hpp>
#include <algorithm>

namespace metro_animation {

struct CancelToken::State {
    FrameScheduler* scheduler = nullptr;
    metro_model::Rect start;
    metro_model::Rect end;
    double duration_ms = 0;
    double start_ms = 0;
    EasingFn easing = nullptr;
    RectTickFn on_tick;
    DoneFn on_done;
    FrameId frame = 0;
    bool cancelled = false;
    bool finished = false;
};

namespace {

void schedule_step(const std::shared_ptr<CancelToken::State>& state);

void step(const std::shared_ptr<CancelToken::State>& state, double now_ms) {
    if (state->cancelled || state->finished) return;

    double progress = 1.0;
    if (state->duration_ms > 0.0)
        progress = std::clamp((now_ms - state->start_ms) / state->duration_ms, 0.0, 1.0);
    const double eased = state->easing(progress);

    if (state->on_tick) state->on_tick(lerp_rect(state->start, state->end, eased));
    // on_tick may cancel (e.g. a new driver took over).
    if (state->cancelled) return;

    if (progress < 1.0) {
        schedule_step(state);
        return;
    }
    state->finished = true;
    if (state->on_done) state->on_done();
}

void schedule_step(const std::shared_ptr<CancelToken::State>& state) {
    // The pending frame keeps the state alive until it runs or is cancelled.
    state->frame = state->scheduler->request_frame([keep = state](double now_ms) {
        step(keep, now_ms);
    });
}

} // namespace

metro_model::Rect lerp_rect(const metro_model::Rect& a, const metro_model::Rect& b, double t) {
    return {
        a.x + (b.x - a.x) * t,
        a.y + (b.y - a.y) * t,
        a.width + (b.width - a.width) * t,
        a.height + (b.height - a.height) * t
    };
}

void CancelToken::cancel() {
    if (!state_ || state_->cancelled || state_->finished) return;
    state_->cancelled = true;
    if (state_->scheduler && state_->frame != 0)
        state_->scheduler->cancel_frame(state_->frame);
}

bool CancelToken::active() const {
    return state_ && !state_->cancelled && !state_->finished;
}

CancelToken animate_rect(FrameScheduler& scheduler,
    const metro_model::Rect& start,
    const metro_model::Rect& end,
    double duration_ms,
    RectTickFn on_tick,
    DoneFn on_done,
    EasingFn easing)
{
    auto state = std::make_shared<CancelToken::State>();
    state->scheduler = &scheduler;
    state->start = start;
    state->end = end;
    state->duration_ms = duration_ms;
    state->start_ms = scheduler.now_ms();
    state->easing = easing ? easing : &ease_in_out_cubic;
    state->on_tick = std::move(on_tick);
    state->on_done = std::move(on_done);
    schedule_step(state);
    return CancelToken(state);
}

} // namespace metro_animation
