#include <curl/curl.h>
#include <gtest/gtest.h>

#include <iostream>

// Main function for the test executable
int main(int argc, char **argv) {
  std::cout << "Running Lumina Test Suite..." << std::endl;

  ::testing::InitGoogleTest(&argc, argv);

  // The fetcher tests use real curl handles against file:// URLs
  curl_global_init(CURL_GLOBAL_DEFAULT);
  int result = RUN_ALL_TESTS();
  curl_global_cleanup();

  if (result == 0) {
    std::cout << "All tests passed!" << std::endl;
  } else {
    std::cout << "Some tests failed. Check output above for details." << std::endl;
  }

  return result;
}
