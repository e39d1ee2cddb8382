#include <gtest/gtest.h>

#include "sdbg/util/environment-variables.hh"
#include "sdbg/util/logging.hh"

using namespace sdbg;

int main(int argc, char ** argv)
{
    if (getEnv("SDBG_TEST_VERBOSE_LOGGING") == "1")
        verbosity = lvlDebug;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
