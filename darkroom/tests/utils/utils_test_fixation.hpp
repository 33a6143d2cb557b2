#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "utils/clock/time_provider.hpp"

namespace darkroom {
class TempDirTests : public ::testing::Test {
 protected:
  std::filesystem::path dir_;

  void                  SetUp() override {
    TimeProvider::Refresh();
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_             = std::filesystem::temp_directory_path() /
           (std::string("darkroom_") + info->test_suite_name() + "_" + info->name());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }
};
}  // namespace darkroom
