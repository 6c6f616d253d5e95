#include <Nimbus++/Utils/Definitions.hpp>
#include <Nimbus++/Utils/Logging.hpp>
#include <Nimbus++/Utils/Types.hpp>

#include "gtest/gtest.h"

using nimbus::utils::types::i32;

fn main(i32 argc, char** argv) -> i32 {
  testing::InitGoogleTest(&argc, argv);

  // Expected failures are logged at warn; keep test output readable.
  nimbus::utils::logging::SetRuntimeLogLevel(nimbus::utils::logging::LogLevel::Error);

  return RUN_ALL_TESTS();
}
