#include <gtest/gtest.h>

#include <aiomega/common/log_level.h>
#include <aiomega/common/simple_logger.h>

int main(int argc, char** argv)
{
    using namespace aiomega::common;

    // Make failures easier to diagnose.
    SimpleLogger::setLogLevel(logDebug);

    testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}

