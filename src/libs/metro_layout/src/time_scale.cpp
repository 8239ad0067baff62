#include <metro_layout/time_scale.hpp>
#include <stdexcept>
#include <utility>
#include <string>

namespace metro_layout {

TimeScale::TimeScale(std::vector<metro_model::TimeAnchor> anchors, double canvas_width)
    : anchors_(std::move(anchors))
    , canvas_width_(canvas_width)
{
    if (!(canvas_width_ > 0.0))
        throw std::invalid_argument("time scale: canvas width must be positive");
    if (anchors_.size() < 2)
        throw std::invalid_argument("time scale: at least two anchors required");
    if (anchors_.front().position != 0.0 || anchors_.back().position != 1.0)
        throw std::invalid_argument("time scale: anchors must span positions 0..1");
    for (std::size_t i = 1; i < anchors_.size(); ++i) {
        if (anchors_[i].year <= anchors_[i - 1].year || anchors_[i].position <= anchors_[i - 1].position) {
            throw std::invalid_argument("time scale: anchor " + std::to_string(i)
                + " is not strictly increasing");
        }
    }
}

TimeScale::TimeScale(const metro_model::TimelineConfig& config)
    : TimeScale(config.anchors, config.canvas.width)
{
}

double TimeScale::year_to_x(double year) const {
    if (year <= anchors_.front().year) return 0.0;
    if (year >= anchors_.back().year) return canvas_width_;

    std::size_t i = 1;
    while (i < anchors_.size() && year > anchors_[i].year) ++i;

    const auto& a = anchors_[i - 1];
    const auto& b = anchors_[i];
    const double t = (year - a.year) / static_cast<double>(b.year - a.year);
    const double position = a.position + (b.position - a.position) * t;
    return position * canvas_width_;
}

double TimeScale::x_to_year(double x) const {
    const double position = x / canvas_width_;
    if (position <= 0.0) return anchors_.front().year;
    if (position >= 1.0) return anchors_.back().year;

    std::size_t i = 1;
    while (i < anchors_.size() && position > anchors_[i].position) ++i;

    const auto& a = anchors_[i - 1];
    const auto& b = anchors_[i];
    const double t = (position - a.position) / (b.position - a.position);
    return a.year + (b.year - a.year) * t;
}

} // namespace metro_layout
