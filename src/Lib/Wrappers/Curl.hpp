#pragma once

#include <chrono>      // std::chrono::milliseconds
#include <curl/curl.h> // curl_easy_*, curl_global_init
#include <utility>     // std::{exchange, move}

#include "Nimbus++/Utils/Error.hpp"
#include "Nimbus++/Utils/Types.hpp"

namespace Curl {
  namespace {
    using nimbus::utils::error::NimbusError;
    using enum nimbus::utils::error::NimbusErrorCode;

    using nimbus::utils::types::Err;
    using nimbus::utils::types::i64;
    using nimbus::utils::types::None;
    using nimbus::utils::types::Option;
    using nimbus::utils::types::RawPointer;
    using nimbus::utils::types::Result;
    using nimbus::utils::types::String;
    using nimbus::utils::types::StringView;
    using nimbus::utils::types::usize;
  } // namespace

  /**
   * @brief Options for initializing a Curl::Easy handle.
   */
  struct EasyOptions {
    Option<String>                    url            = None;    ///< URL to set for the transfer
    String*                           writeBuffer    = nullptr; ///< Pointer to a string buffer to store the response
    Option<std::chrono::milliseconds> timeout        = None;    ///< Timeout for the entire request
    Option<std::chrono::milliseconds> connectTimeout = None;    ///< Timeout for the connection phase
    Option<String>                    userAgent      = None;    ///< User-agent string
  };

  /**
   * @brief RAII wrapper for CURL easy handle.
   */
  class Easy {
    CURL*               m_curl      = nullptr;
    Option<NimbusError> m_initError = None; ///< Set when the options constructor could not apply an option

    static fn writeCallback(RawPointer contents, const usize size, const usize nmemb, String* str) -> usize {
      const usize totalSize = size * nmemb;
      str->append(static_cast<char*>(contents), totalSize);
      return totalSize;
    }

    // Records the first failing option as the init error.
    fn apply(Result<> res) -> bool {
      if (!res)
        m_initError = std::move(res).error();

      return !m_initError;
    }

   public:
    Easy()
      : m_curl(curl_easy_init()) {
      if (!m_curl)
        m_initError = NimbusError(InternalError, "curl_easy_init() failed");
    }

    /**
     * @brief Initializes a CURL easy handle and applies @p options in order.
     */
    explicit Easy(const EasyOptions& options)
      : Easy() {
      if (m_initError)
        return;

      // Never let a signal interrupt a timed-out DNS lookup in a worker thread.
      if (!apply(setOpt(CURLOPT_NOSIGNAL, 1L)))
        return;

      if (options.url && !apply(setUrl(*options.url)))
        return;

      if (options.writeBuffer && !apply(setWriteFunction(options.writeBuffer)))
        return;

      if (options.timeout && !apply(setTimeout(*options.timeout)))
        return;

      if (options.connectTimeout && !apply(setConnectTimeout(*options.connectTimeout)))
        return;

      if (options.userAgent)
        apply(setUserAgent(*options.userAgent));
    }

    ~Easy() {
      if (m_curl)
        curl_easy_cleanup(m_curl);
    }

    // Non-copyable
    Easy(const Easy&)                = delete;
    fn operator=(const Easy&)->Easy& = delete;

    Easy(Easy&& other) noexcept
      : m_curl(std::exchange(other.m_curl, nullptr)), m_initError(std::move(other.m_initError)) {}

    fn operator=(Easy&& other) noexcept -> Easy& {
      if (this != &other) {
        if (m_curl)
          curl_easy_cleanup(m_curl);
        m_curl      = std::exchange(other.m_curl, nullptr);
        m_initError = std::move(other.m_initError);
      }

      return *this;
    }

    [[nodiscard]] explicit operator bool() const {
      return m_curl != nullptr && !m_initError;
    }

    [[nodiscard]] fn getInitializationError() const -> const Option<NimbusError>& {
      return m_initError;
    }

    template <typename T>
    fn setOpt(const CURLoption option, T value) -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (const CURLcode res = curl_easy_setopt(m_curl, option, value); res != CURLE_OK)
        ERR_FMT(InternalError, "curl_easy_setopt failed: {}", curl_easy_strerror(res));

      return {};
    }

    /**
     * @brief Performs a blocking transfer.
     * @return Timeout if the transfer exceeded its time limit, NetworkError for any other transport failure.
     */
    fn perform() -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (m_initError)
        ERR_FMT(InternalError, "Cannot perform request, CURL handle initialization failed: {}", m_initError->message);

      if (const CURLcode res = curl_easy_perform(m_curl); res != CURLE_OK) {
        if (res == CURLE_OPERATION_TIMEDOUT)
          ERR_FMT(Timeout, "Request timed out: {}", curl_easy_strerror(res));

        ERR_FMT(NetworkError, "curl_easy_perform failed: {}", curl_easy_strerror(res));
      }

      return {};
    }

    template <typename T>
    fn getInfo(const CURLINFO info, T* value) -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (const CURLcode res = curl_easy_getinfo(m_curl, info, value); res != CURLE_OK)
        ERR_FMT(InternalError, "curl_easy_getinfo failed: {}", curl_easy_strerror(res));

      return {};
    }

    /**
     * @brief HTTP status of the last transfer.
     */
    fn responseCode() -> Result<long> {
      long status = 0;

      if (Result res = getInfo(CURLINFO_RESPONSE_CODE, &status); !res)
        return Err(res.error());

      return status;
    }

    /**
     * @brief URL-encodes a query parameter value.
     */
    static fn escape(const StringView text) -> Result<String> {
      char* escaped = curl_easy_escape(nullptr, text.data(), static_cast<int>(text.length()));

      if (!escaped)
        ERR(OutOfMemory, "curl_easy_escape failed");

      String result(escaped);

      curl_free(escaped);

      return result;
    }

    fn setUrl(const String& url) -> Result<> {
      return setOpt(CURLOPT_URL, url.c_str());
    }

    fn setWriteFunction(String* buffer) -> Result<> {
      if (!buffer)
        ERR(InvalidArgument, "Write buffer cannot be null");

      if (Result res = setOpt(CURLOPT_WRITEFUNCTION, writeCallback); !res)
        return res;

      return setOpt(CURLOPT_WRITEDATA, buffer);
    }

    fn setTimeout(const std::chrono::milliseconds timeout) -> Result<> {
      return setOpt(CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    }

    fn setConnectTimeout(const std::chrono::milliseconds timeout) -> Result<> {
      return setOpt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    }

    fn setUserAgent(const String& userAgent) -> Result<> {
      return setOpt(CURLOPT_USERAGENT, userAgent.c_str());
    }
  };

  /**
   * @brief Initializes CURL globally. Must run before any handle is created on another thread.
   */
  inline fn GlobalInit(const long flags = CURL_GLOBAL_ALL) -> Result<> {
    if (const CURLcode res = curl_global_init(flags); res != CURLE_OK)
      ERR_FMT(InternalError, "curl_global_init failed: {}", curl_easy_strerror(res));

    return {};
  }
} // namespace Curl
