// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_QUERY_QUERYERROR_H
#define FSINDEX_QUERY_QUERYERROR_H

#include <stdexcept>

namespace FsIndex {
    // Raised for malformed queries. Nothing is evaluated once parsing has failed.
    class QueryParseError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
}

#endif //FSINDEX_QUERY_QUERYERROR_H
