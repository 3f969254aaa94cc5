#include "distd/logger.h"
#include "distd/var_dir.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <sodium.h>

int main(int argc, char **argv) {
  namespace fs = std::filesystem;
  fs::path base = fs::temp_directory_path() / "distd_test_var";
  distd::setVarDir(base.string());
  fs::create_directories(distd::logsDir());
  fs::create_directories(distd::chunksDir());

  try {
    Logger::init(distd::logsDir() + "/distd_tests.log", LogLevel::DEBUG);
    if (sodium_init() < 0) {
      std::cerr << "FATAL: libsodium failed to initialize" << std::endl;
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Test initialization failed: " << e.what() << std::endl;
    return 1;
  }

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
