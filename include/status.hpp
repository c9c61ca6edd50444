//
//  status.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace subforge {

/**
 * @brief Result object with success flag and optional error message.
 *
 * When `ok == true`, `message` is empty. On failure, `message` contains a short description of
 * what went wrong (e.g., nothing to export, failure to open or parse a file).
 */
struct Status {
    bool ok{false};
    std::string message;
};

inline Status make_status(bool ok, std::string msg = {}) { return Status{ok, std::move(msg)}; }

}  // namespace subforge
