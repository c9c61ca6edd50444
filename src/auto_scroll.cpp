//
//  auto_scroll.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "auto_scroll.hpp"

#include <cmath>

#include "logging.hpp"

namespace subforge {

bool AutoScrollController::on_playhead(Viewport &viewport, double playhead,
                                       bool drag_active) const {
    if (!enabled_ || drag_active || !std::isfinite(playhead)) {
        return false;
    }
    if (playhead >= viewport.view_start() && playhead <= viewport.view_end()) {
        return false;
    }
    viewport.recenter_on(playhead);
    SF_LOG("autoscroll", "playhead " << seconds_str(playhead) << " -> view start "
                                     << seconds_str(viewport.view_start()));
    return true;
}

}  // namespace subforge
