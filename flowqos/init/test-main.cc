#include "flowqos/init/init.h"
#include "gtest/gtest.h"

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  flowqos::MainInit(argc, argv, "flowqos unit tests");
  return RUN_ALL_TESTS();
}
