// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_VERSION_H
#define FSINDEX_VERSION_H

#include <string_view>

namespace Version {
    inline constexpr std::string_view VERSION = "0.4.0";

    // Bumped whenever the D-Bus reply layout changes.
    inline constexpr unsigned int API_VERSION = 1;
};

#endif //FSINDEX_VERSION_H
