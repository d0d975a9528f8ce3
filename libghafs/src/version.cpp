// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "ghafs/version.hpp"

namespace ghafs
{
    std::string version()
    {
        return GHAFS_VERSION_STRING;
    }
}
