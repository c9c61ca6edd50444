//
//  viewport.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <vector>

namespace subforge {

/**
 * @brief Visible time window over the media timeline.
 *
 * Maps between seconds and a fractional position [0,1] across the timeline track.
 * The span stays within [kMinSpan, total_duration]; while the duration is unknown (<= 0)
 * the span is not capped from above.
 */
class Viewport {
   public:
    static constexpr double kMinSpan = 1.0;

    explicit Viewport(double span = 15.0, double total_duration = 0.0);

    double view_start() const { return view_start_; }
    double view_span() const { return view_span_; }
    double view_end() const { return view_start_ + view_span_; }
    double total_duration() const { return total_duration_; }

    // Media duration became known (or changed); re-clamps span and start.
    void set_total_duration(double seconds);

    double time_at(double fraction) const { return view_start_ + fraction * view_span_; }
    double coordinate_of(double time) const { return (time - view_start_) / view_span_; }
    bool is_visible(double time) const;

    // Pixel-space variants for a track of the given width.
    double time_at_pixel(double x, double track_width) const;
    double pixel_of(double time, double track_width) const;

    void zoom_in();
    void zoom_out();
    void pan_by(double fraction_of_span);

    // Put `time` in the middle of the view (start clamped at 0).
    void recenter_on(double time);
    void set_view_start(double seconds);

    // Ruler ticks for the visible window: 0.5s/1s/5s steps depending on the span.
    std::vector<double> tick_marks() const;

   private:
    double max_start() const;
    void clamp_span();

    double view_start_ = 0.0;
    double view_span_ = 15.0;
    double total_duration_ = 0.0;
};

}  // namespace subforge
