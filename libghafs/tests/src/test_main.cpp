// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_session.hpp>

int
main(int argc, char* argv[])
{
    Catch::Session session;

    // Keep declaration order, Catch2 3.9 defaults to random order
    session.configData().runOrder = Catch::TestRunOrder::Declared;

    int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0)
    {
        return returnCode;
    }

    return session.run();
}
