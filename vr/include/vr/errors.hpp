/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace vr {

// Errors that terminate the process. Request-scoped failures are
// reported through RequestOutcome and activity records instead.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid configuration, detected before the server starts.
class ConfigError : public Error {
public:
    using Error::Error;
};

// socket()/bind()/listen() failure.
class BindError : public Error {
public:
    using Error::Error;
};

// Graceful shutdown did not complete within the grace period.
class ShutdownError : public Error {
public:
    using Error::Error;
};

} // namespace vr
