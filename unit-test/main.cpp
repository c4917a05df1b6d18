#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "env.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // SANDBOX_RUNNER 等环境变量可以覆盖构建时确定的 sandbox-runner 路径
    sandbox::load_env_config();
  }
  virtual void TearDown() {
    //  Stub
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
