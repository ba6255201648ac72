// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#define DETSTAB_VERSION_MAJOR 1
#define DETSTAB_VERSION_MINOR 0
#define DETSTAB_VERSION_PATCH 0
#define DETSTAB_VERSION_STRING "1.0.0"
