#include <metro_canvas/map_controller.hpp>
#include <metro_animation/easing.hpp>
#include <metro_layout/layout_constants.hpp>
#include <metro_logging/logging.hpp>
#include <utility>

namespace metro_canvas {

namespace {

using namespace metro_layout::layout;

} // namespace

MapController::MapController(metro_animation::FrameScheduler& scheduler, const ViewportLimits& limits)
    : scheduler_(scheduler)
    , limits_(limits)
    , state_(initial_view_state(limits))
{
}

MapController::~MapController() {
    animation_.cancel();
}

void MapController::emit_view() {
    if (on_view_changed_) on_view_changed_(state_.view);
}

void MapController::set_state(MapViewState next) {
    const bool moved = !same_rect(next.view, state_.view);
    state_ = std::move(next);
    if (moved) emit_view();
}

void MapController::apply(const Transition& transition) {
    MapViewState next = transition(state_);
    next.view = clamp_view(next.view, limits_);
    if (!same_rect(next.view, state_.view)) {
        cancel_animation();
        mode_ = state_.panning ? ViewMode::Transitioning : ViewMode::Idle;
    }
    set_state(std::move(next));
}

void MapController::set_view(const metro_model::Rect& view) {
    cancel_animation();
    set_state(apply_set_view(state_, view, limits_));
}

void MapController::cancel_animation() {
    if (!animation_.active()) return;
    animation_.cancel();
    if (!state_.panning) mode_ = ViewMode::Idle;
}

void MapController::animate_to(const metro_model::Rect& target, double duration_ms, std::function<void()> on_done,
    metro_animation::EasingFn easing) {
    cancel_animation();
    // The animation becomes the only driver; a live drag stops here.
    if (state_.panning) {
        MapViewState next = state_;
        next.panning = false;
        set_state(std::move(next));
    }
    const metro_model::Rect end = clamp_view(target, limits_);
    mode_ = ViewMode::Transitioning;
    animation_ = metro_animation::animate_rect(scheduler_, state_.view, end, duration_ms,
        [this](const metro_model::Rect& r) {
            MapViewState next = state_;
            next.view = r;
            set_state(std::move(next));
        },
        [this, done = std::move(on_done)]() {
            mode_ = ViewMode::Idle;
            if (done) done();
        },
        easing);
}

void MapController::zoom_at(const metro_model::Point& anchor, double factor) {
    const metro_model::Rect target = zoom_at_point(state_.view, factor, anchor, limits_);
    animate_to(target, zoom_duration_ms, {}, &metro_animation::ease_out);
}

void MapController::zoom_in() {
    animate_to(apply_zoom_in(state_, limits_).view, zoom_duration_ms);
}

void MapController::zoom_out() {
    animate_to(apply_zoom_out(state_, limits_).view, zoom_duration_ms);
}

void MapController::reset_view() {
    animate_to(full_view(limits_), focus_duration_ms);
}

void MapController::focus_point(const metro_model::Point& point, double duration_ms) {
    animate_to(apply_center_on(state_, point, limits_).view, duration_ms);
}

void MapController::focus_era(const metro_model::Era& era, const metro_layout::TimeScale& scale) {
    MapViewState next = apply_focus_era(state_, era.id);
    set_state(std::move(next));
    const double aspect = state_.view.height > 0.0 ? state_.view.width / state_.view.height : 0.0;
    animate_to(era_view(era, scale, limits_, aspect), focus_duration_ms);
}

void MapController::begin_drag() {
    cancel_animation();
    drag_start_view_ = state_.view;
    MapViewState next = state_;
    next.panning = true;
    set_state(std::move(next));
    mode_ = ViewMode::Transitioning;
}

void MapController::drag_by(double dx, double dy) {
    if (!state_.panning || animation_.active()) return;
    MapViewState next = state_;
    next.view = pan_by(drag_start_view_, dx, dy, limits_);
    set_state(std::move(next));
}

void MapController::end_drag() {
    if (!state_.panning) return;
    MapViewState next = state_;
    next.panning = false;
    set_state(std::move(next));
    mode_ = ViewMode::Idle;
}

void MapController::start_journey(std::vector<JourneyStop> stops) {
    journey_ = std::move(stops);
    if (journey_.empty()) {
        metro_logging::get_logger("canvas")->warn("journey has no stops");
        return;
    }
    MapViewState next = state_;
    next.journey_mode = true;
    set_state(std::move(next));
    journey_go_to(0);
}

bool MapController::journey_go_to(std::size_t index) {
    if (!state_.journey_mode || index >= journey_.size()) return false;
    MapViewState next = apply_select_station(state_, journey_[index].station_id);
    next.journey_index = index;
    set_state(std::move(next));
    focus_point(journey_[index].point, focus_duration_ms);
    return true;
}

bool MapController::journey_next() {
    return journey_go_to(state_.journey_index + 1);
}

bool MapController::journey_prev() {
    if (state_.journey_index == 0) return false;
    return journey_go_to(state_.journey_index - 1);
}

void MapController::end_journey() {
    MapViewState next = state_;
    next.journey_mode = false;
    next.journey_index = 0;
    set_state(std::move(next));
}

} // namespace metro_canvas
