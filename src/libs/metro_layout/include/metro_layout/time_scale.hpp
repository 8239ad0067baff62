#pragma once

#include <metro_model/timeline_config.hpp>
#include <vector>

namespace metro_layout {

// Piecewise-linear year -> x map over hand-chosen density anchors.
class TimeScale {
public:
    // Throws std::invalid_argument if the anchor table is malformed
    // (fewer than two anchors, not strictly increasing, not spanning 0..1)
    // or the width is not positive.
    TimeScale(std::vector<metro_model::TimeAnchor> anchors, double canvas_width);
    explicit TimeScale(const metro_model::TimelineConfig& config);

    // Years before the first anchor map to 0, after the last to canvas width.
    double year_to_x(double year) const;
    // Inverse of year_to_x, clamped the same way.
    double x_to_year(double x) const;

    int start_year() const { return anchors_.front().year; }
    int end_year() const { return anchors_.back().year; }
    double canvas_width() const { return canvas_width_; }
    const std::vector<metro_model::TimeAnchor>& anchors() const { return anchors_; }

private:
    std::vector<metro_model::TimeAnchor> anchors_;
    double canvas_width_ = 0;
};

} // namespace metro_layout
