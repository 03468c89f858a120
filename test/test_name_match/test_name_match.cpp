#include <unity.h>
#include "devices/name_match.hpp"

using pwrctrl::matches;

void setUp(void) {}
void tearDown(void) {}

void test_exact_match(void) {
    TEST_ASSERT_TRUE(matches("Lamp", "Lamp"));
}

void test_case_insensitive(void) {
    TEST_ASSERT_TRUE(matches("lamp", "LAMP"));
    TEST_ASSERT_TRUE(matches("DESK", "desk"));
}

void test_substring(void) {
    TEST_ASSERT_TRUE(matches("desk", "Standing Desk Lamp"));
    TEST_ASSERT_TRUE(matches("168.1", "192.168.1.50"));
}

void test_no_match(void) {
    TEST_ASSERT_FALSE(matches("Fan", "Lamp"));
}

void test_pattern_longer_than_candidate(void) {
    TEST_ASSERT_FALSE(matches("Lamp2", "Lamp"));
}

void test_empty_pattern_only_matches_empty(void) {
    TEST_ASSERT_FALSE(matches("", "Lamp"));
    TEST_ASSERT_TRUE(matches("", ""));
}

void test_empty_candidate(void) {
    TEST_ASSERT_FALSE(matches("Lamp", ""));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_exact_match);
    RUN_TEST(test_case_insensitive);
    RUN_TEST(test_substring);
    RUN_TEST(test_no_match);
    RUN_TEST(test_pattern_longer_than_candidate);
    RUN_TEST(test_empty_pattern_only_matches_empty);
    RUN_TEST(test_empty_candidate);
    return UNITY_END();
}
