// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_VERSION_HPP
#define GHAFS_VERSION_HPP

#include <string>

#define GHAFS_VERSION_MAJOR 0
#define GHAFS_VERSION_MINOR 1
#define GHAFS_VERSION_PATCH 0

#define GHAFS_VERSION_STRING "0.1.0"
#define GHAFS_VERSION                                                                              \
    (GHAFS_VERSION_MAJOR * 10000 + GHAFS_VERSION_MINOR * 100 + GHAFS_VERSION_PATCH)

namespace ghafs
{
    std::string version();
}

#endif
