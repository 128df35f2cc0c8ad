/// Custom test entry point that explicitly shuts down spdlog and avoids
/// static destruction order issues with the spdlog shared library.
/// Uses _exit() to skip atexit handlers that trigger a double-free in
/// spdlog's shared library unload path.

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int iResult = RUN_ALL_TESTS();

  spdlog::drop_all();
  spdlog::shutdown();

  // All test results are already printed; the exit code is what matters.
  _exit(iResult);
}
