//
//  media_time_source.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

namespace subforge {

// The media player as seen by the editor: a readable/writable position and a duration
// that becomes valid once the media has loaded (<= 0 before that). Writing the position
// is a seek request.
class MediaTimeSource {
   public:
    virtual ~MediaTimeSource() = default;
    virtual double current_time() const = 0;
    virtual void set_current_time(double seconds) = 0;
    virtual double duration() const = 0;
};

}  // namespace subforge
