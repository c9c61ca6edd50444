//
//  auto_scroll.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "viewport.hpp"

namespace subforge {

// Keeps the viewport on the playhead during playback. Recentering is suppressed while a
// drag is in progress so the pointer's reference frame stays put.
class AutoScrollController {
   public:
    explicit AutoScrollController(bool enabled = true) : enabled_(enabled) {}


    // Returns true when the viewport was moved.
    bool on_playhead(Viewport &viewport, double playhead, bool drag_active) const;

   private:
    bool enabled_ = true;
};

}  // namespace subforge
