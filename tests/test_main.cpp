#include <gtest/gtest.h>

#include <curl/curl.h>

#include <iostream>

// Main function for the test executable
int main(int argc, char **argv) {
  std::cout << "Running Titan Shield Test Suite..." << std::endl;

  ::testing::InitGoogleTest(&argc, argv);

  // Provider and CLI tests create curl handles; none of them reach the network
  curl_global_init(CURL_GLOBAL_DEFAULT);

  // Fixtures create and remove their own temporary databases; no global setup required here
  int result = RUN_ALL_TESTS();

  curl_global_cleanup();

  if (result == 0) {
    std::cout << "All tests passed!" << std::endl;
  } else {
    std::cout << "Some tests failed. Check output above for details." << std::endl;
  }

  return result;
}
