// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "job_context.h"

namespace bricklayers {

const char* prescan_status_name(PreScanStatus status) {
    switch (status) {
    case PreScanStatus::NONE:
        return "none";
    case PreScanStatus::PENDING:
        return "pending";
    case PreScanStatus::READY:
        return "ready";
    case PreScanStatus::FAILED:
        return "failed";
    case PreScanStatus::ABANDONED:
        return "abandoned";
    }
    return "unknown";
}

} // namespace bricklayers
