/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "vr/types.hpp"

namespace vr {

const char* to_string(AccessMode m) {
    switch (m) {
        case AccessMode::Whitelist:    return "whitelist";
        case AccessMode::FirstNUnique: return "first-n-unique";
        case AccessMode::ServeOnce:    return "serve-once";
    }
    return "unknown";
}

const char* to_string(ShutdownReason r) {
    switch (r) {
        case ShutdownReason::None:         return "none";
        case ShutdownReason::LimitReached: return "limit-reached";
        case ShutdownReason::Manual:       return "manual";
    }
    return "unknown";
}

} // namespace vr
