// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 devtray Contributors

#include "Logging.h"

// Define logging categories
// By default, debug messages are disabled; enable via QT_LOGGING_RULES

Q_LOGGING_CATEGORY(devtrayCore, "devtray.core", QtWarningMsg)
Q_LOGGING_CATEGORY(devtrayEvents, "devtray.events", QtWarningMsg)
Q_LOGGING_CATEGORY(devtrayNotify, "devtray.notify", QtWarningMsg)
Q_LOGGING_CATEGORY(devtrayQubes, "devtray.qubes", QtWarningMsg)
Q_LOGGING_CATEGORY(devtrayDBus, "devtray.dbus", QtWarningMsg)
