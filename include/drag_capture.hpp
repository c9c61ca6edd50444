//
//  drag_capture.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

namespace subforge {

// Toolkit side of pointer capture: while captured, pointer moves/releases outside the
// timeline keep reaching it.
class PointerCaptureHost {
   public:
    virtual ~PointerCaptureHost() = default;
    virtual void capture_pointer() = 0;
    virtual void release_pointer() = 0;
};

// Holds a pointer capture for the lifetime of a drag gesture. Released exactly once, on
// whatever path ends the gesture.
class DragCapture {
   public:
    explicit DragCapture(PointerCaptureHost *host) : host_(host) {
        if (host_) {
            host_->capture_pointer();
        }
    }
    ~DragCapture() { release(); }

    DragCapture(const DragCapture &) = delete;
    DragCapture &operator=(const DragCapture &) = delete;

    DragCapture(DragCapture &&other) noexcept : host_(other.host_) { other.host_ = nullptr; }
    DragCapture &operator=(DragCapture &&other) noexcept {
        if (this != &other) {
            release();
            host_ = other.host_;
            other.host_ = nullptr;
        }
        return *this;
    }

   private:
    void release() {
        if (host_) {
            host_->release_pointer();
            host_ = nullptr;
        }
    }

    PointerCaptureHost *host_ = nullptr;
};

}  // namespace subforge
