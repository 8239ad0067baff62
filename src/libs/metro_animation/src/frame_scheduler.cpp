#include <metro_animation/frame_scheduler.hpp>
#include <algorithm>
#include <utility>

namespace metro_animation {

FrameId ManualFrameScheduler::request_frame(FrameCallback callback) {
    const FrameId id = next_id_++;
    pending_.push_back(Pending{ id, std::move(callback) });
    return id;
}

void ManualFrameScheduler::cancel_frame(FrameId id) {
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
        [id](const Pending& p) { return p.id == id; }), pending_.end());
}

void ManualFrameScheduler::advance(double dt_ms) {
    if (dt_ms > 0.0) now_ms_ += dt_ms;
    std::vector<Pending> due;
    due.swap(pending_);
    for (auto& p : due) {
        if (p.callback) p.callback(now_ms_);
    }
}

} // namespace metro_animation
