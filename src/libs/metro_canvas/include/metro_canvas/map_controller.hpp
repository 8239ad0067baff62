#pragma once

#include <metro_animation/frame_scheduler.hpp>
#include <metro_animation/rect_animator.hpp>
#include <metro_canvas/navigation.hpp>
#include <metro_canvas/view_state.hpp>
#include <metro_canvas/viewport.hpp>
#include <functional>
#include <vector>

namespace metro_canvas {

enum class ViewMode {
    Idle,
    Transitioning // an animation or a drag is driving the view
};

// Owner of the map view state. At most one driver moves the view at a time:
// every new animation, drag or direct view change cancels the animation in flight.
class MapController {
public:
    using ViewChangedFn = std::function<void(const metro_model::Rect&)>;
    using Transition = std::function<MapViewState(const MapViewState&)>;

    MapController(metro_animation::FrameScheduler& scheduler, const ViewportLimits& limits);
    ~MapController();

    MapController(const MapController&) = delete;
    MapController& operator=(const MapController&) = delete;

    const MapViewState& state() const { return state_; }
    const ViewportLimits& limits() const { return limits_; }
    ViewMode mode() const { return mode_; }
    bool animating() const { return animation_.active(); }

    // Called with the view rect after every change.
    void set_on_view_changed(ViewChangedFn fn) { on_view_changed_ = std::move(fn); }

    // Applies a pure transition. A transition that moves the view takes over as driver.
    void apply(const Transition& transition);

    void set_view(const metro_model::Rect& view);
    // easing defaults to ease-in-out cubic.
    void animate_to(const metro_model::Rect& target, double duration_ms, std::function<void()> on_done = {},
        metro_animation::EasingFn easing = nullptr);
    void cancel_animation();

    // Wheel zoom anchored at a world point, animated.
    void zoom_at(const metro_model::Point& anchor, double factor);
    void zoom_in();
    void zoom_out();
    void reset_view();
    void focus_point(const metro_model::Point& point, double duration_ms);
    void focus_era(const metro_model::Era& era, const metro_layout::TimeScale& scale);

    // Live drag: deltas are world units relative to the view at begin_drag.
    // Starting an animation ends the drag.
    void begin_drag();
    void drag_by(double dx, double dy);
    void end_drag();

    void start_journey(std::vector<JourneyStop> stops);
    bool journey_next();
    bool journey_prev();
    bool journey_go_to(std::size_t index);
    void end_journey();
    const std::vector<JourneyStop>& journey() const { return journey_; }

private:
    void set_state(MapViewState next);
    void emit_view();

    metro_animation::FrameScheduler& scheduler_;
    ViewportLimits limits_;
    MapViewState state_;
    ViewMode mode_ = ViewMode::Idle;
    metro_animation::CancelToken animation_;
    metro_model::Rect drag_start_view_;
    std::vector<JourneyStop> journey_;
    ViewChangedFn on_view_changed_;
};

} // namespace metro_canvas
