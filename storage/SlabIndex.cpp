// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "SlabIndex.h"

#include <stdexcept>

namespace FsIndex {
    SlabIndex::SlabIndex(std::size_t value) {
        if (value >= INVALID) {
            throw std::length_error("slab index exhausted the u32 range");
        }
        m_value = static_cast<std::uint32_t>(value);
    }
}
