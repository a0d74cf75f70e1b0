#include "common/logger.hpp"

#include <gtest/gtest.h>

int main(int argc, char* argv[]) {
    testing::InitGoogleTest(&argc, argv);
    // Suites disabled through unittest_defines.hpp.
    testing::GTEST_FLAG(filter) += ":-FILTERED_*";
    naivecall::logging::InitLogger(naivecall::logging::Level::WARNING);
    return RUN_ALL_TESTS();
}
