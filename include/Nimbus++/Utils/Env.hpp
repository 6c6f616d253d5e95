#pragma once

#ifdef _WIN32
  #include <stdlib.h> // NOLINT(*-deprecated-headers)
#endif

#include <cstdlib> // std::{getenv, free}
#include <format>  // std::format

#include "Definitions.hpp"
#include "Error.hpp"
#include "Types.hpp"

namespace nimbus::utils::env {
  namespace {
    using types::Err;
    using types::PCStr;
    using types::Result;
    using types::String;

    using error::NimbusError;
    using enum error::NimbusErrorCode;
  } // namespace

  /**
   * @brief Reads an environment variable.
   *
   * A variable that is set but empty counts as unset, so `XDG_CONFIG_HOME=` or
   * `NIMBUS_API_KEY=` never override a configured value with nothing.
   *
   * @return An owned copy of the value, or NotFound.
   */
  [[nodiscard]] inline fn GetEnv(const PCStr name) -> Result<String> {
#ifdef _WIN32
    char*             rawPtr     = nullptr;
    types::usize      bufferSize = 0;
    const types::i32  err        = _dupenv_s(&rawPtr, &bufferSize, name);

    const types::UniquePointer<char, decltype(&free)> owned(rawPtr, free);

    if (err != 0)
      return Err(NimbusError(PermissionDenied, std::format("Failed to read environment variable {}", name)));

    const PCStr value = owned.get();
#else
    const PCStr value = std::getenv(name);
#endif

    if (!value || *value == '\0')
      return Err(NimbusError(NotFound, std::format("Environment variable {} not set", name)));

    return String(value);
  }
} // namespace nimbus::utils::env
