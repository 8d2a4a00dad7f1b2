// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#pragma once

#include <QLoggingCategory>

/**
 * devtray Logging Categories
 * 
 * Usage:
 *   #include "Logging.h"
 *   qCDebug(devtrayEvents) << "Message";
 *   qCWarning(devtrayCore) << "Warning message";
 * 
 * Enable via environment variable:
 *   QT_LOGGING_RULES="devtray.*=true" ./build/bin/devtray
 */

// Registry, snapshot loading and attach/detach coordination
Q_DECLARE_LOGGING_CATEGORY(devtrayCore)

// Event dispatch and reconciliation
Q_DECLARE_LOGGING_CATEGORY(devtrayEvents)

// Debounced device notifications
Q_DECLARE_LOGGING_CATEGORY(devtrayNotify)

// qubesd admin socket communication
Q_DECLARE_LOGGING_CATEGORY(devtrayQubes)

// Session bus services (notifications, devices service)
Q_DECLARE_LOGGING_CATEGORY(devtrayDBus)
