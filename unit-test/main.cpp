#include <curl/curl.h>
#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    curl_global_init(CURL_GLOBAL_ALL);
  }
  virtual void TearDown() {
    curl_global_cleanup();
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
