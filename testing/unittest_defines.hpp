#ifndef _NAIVECALL_UNITTEST_DEFINES_H_
#define _NAIVECALL_UNITTEST_DEFINES_H_

// Define ENABLE_UNIT_TESTS to 0 before including this header to
// rename the suites of a file into FILTERED_*, which gtest_main skips.
#if ENABLE_UNIT_TESTS
#define T(x)            x
#define MY_TEST(x, y)   TEST(x, y)
#define MY_TEST_F(x, y) TEST_F(x, y)
#else
#define T(x)            FILTERED_##x
#define MY_TEST(x, y)   TEST(FILTERED_##x, y)
#define MY_TEST_F(x, y) TEST_F(FILTERED_##x, y)
#endif

#endif
