//
//  viewport.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "viewport.hpp"

#include <algorithm>
#include <cmath>

#include "logging.hpp"

namespace {

constexpr double kFineTickSpan = 5.0;
constexpr double kMediumTickSpan = 15.0;

}  // namespace

namespace subforge {

Viewport::Viewport(double span, double total_duration)
    : view_span_(span), total_duration_(std::max(0.0, total_duration)) {
    clamp_span();
}

void Viewport::clamp_span() {
    if (!(view_span_ >= kMinSpan)) {
        view_span_ = kMinSpan;
    }
    if (total_duration_ > 0.0) {
        // Media shorter than kMinSpan keeps the floor.
        view_span_ = std::max(kMinSpan, std::min(view_span_, total_duration_));
    }
}

double Viewport::max_start() const {
    if (total_duration_ <= 0.0) {
        return std::max(0.0, view_start_);
    }
    return std::max(0.0, total_duration_ - view_span_);
}

void Viewport::set_total_duration(double seconds) {
    total_duration_ = std::isfinite(seconds) ? std::max(0.0, seconds) : 0.0;
    clamp_span();
    view_start_ = std::clamp(view_start_, 0.0, max_start());
    SF_LOG("viewport", "duration=" << seconds_str(total_duration_)
                                   << " span=" << seconds_str(view_span_));
}

bool Viewport::is_visible(double time) const {
    const double c = coordinate_of(time);
    return c >= 0.0 && c <= 1.0;
}

double Viewport::time_at_pixel(double x, double track_width) const {
    if (track_width <= 0.0) {
        return view_start_;
    }
    return time_at(x / track_width);
}

double Viewport::pixel_of(double time, double track_width) const {
    return coordinate_of(time) * track_width;
}

void Viewport::zoom_in() {
    view_span_ = std::max(kMinSpan, view_span_ / 2.0);
    SF_LOG("viewport", "zoom in span=" << seconds_str(view_span_));
}

void Viewport::zoom_out() {
    view_span_ *= 2.0;
    if (total_duration_ > 0.0 && view_span_ >= total_duration_) {
        view_span_ = std::max(kMinSpan, total_duration_);
        view_start_ = 0.0;
    } else {
        view_start_ = std::clamp(view_start_, 0.0, max_start());
    }
    SF_LOG("viewport", "zoom out span=" << seconds_str(view_span_)
                                        << " start=" << seconds_str(view_start_));
}

void Viewport::pan_by(double fraction_of_span) {
    const double target = view_start_ + fraction_of_span * view_span_;
    if (total_duration_ > 0.0) {
        view_start_ = std::clamp(target, 0.0, max_start());
    } else {
        view_start_ = std::max(0.0, target);
    }
}

void Viewport::recenter_on(double time) { view_start_ = std::max(0.0, time - view_span_ / 2.0); }

void Viewport::set_view_start(double seconds) {
    view_start_ = std::isfinite(seconds) ? std::max(0.0, seconds) : 0.0;
}

std::vector<double> Viewport::tick_marks() const {
    const double step =
        view_span_ <= kFineTickSpan ? 0.5 : (view_span_ <= kMediumTickSpan ? 1.0 : 5.0);
    std::vector<double> ticks;
    const double first = std::floor(view_start_ / step) * step;
    const double last = view_end();
    // Index-based stepping keeps ticks exact multiples of the step.
    for (long i = 0;; ++i) {
        const double t = first + static_cast<double>(i) * step;
        if (t > last + 1e-9) {
            break;
        }
        if (t >= view_start_ - 1e-9 && (total_duration_ <= 0.0 || t <= total_duration_ + 1e-9)) {
            ticks.push_back(t);
        }
    }
    return ticks;
}

}  // namespace subforge
