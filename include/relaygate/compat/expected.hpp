/**
 * @file expected.hpp
 * @brief Selects the expected<T, E> implementation behind relaygate::Result.
 *
 * Only core/error.hpp should include this directly; everything else spells
 * results as relaygate::Result<T> and errors via make_error()/forward_error().
 *
 * - Standard library with __cpp_lib_expected (C++23): std::expected.
 * - Otherwise: tl::expected (https://github.com/TartanLlama/expected).
 *
 * RELAYGATE_STD_EXPECTED is 1 or 0 accordingly, so tools can report the backend.
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #define RELAYGATE_STD_EXPECTED 1
  #include <expected>
  namespace relaygate_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
      inline constexpr const char* expected_backend = "std";
  }
#else
  #define RELAYGATE_STD_EXPECTED 0
  #include <tl/expected.hpp>
  namespace relaygate_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
      inline constexpr const char* expected_backend = "tl";
  }
#endif
