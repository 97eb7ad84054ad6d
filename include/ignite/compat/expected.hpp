/**
* @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected.
 *
 * This header provides a unified alias for expected/unexpected so the rest
 * of the codebase does not depend directly on a specific implementation.
 *
 * - With a standard library that ships <expected>: std::expected.
 * - Otherwise: <tl/expected.hpp>, the header-only backport by TartanLlama
 *   (https://github.com/TartanLlama/expected).
 *
 * Only the construction/observer subset common to both is used (no monadic
 * and_then/transform), so the 202202L revision of <expected> is enough.
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
  #include <expected>
  namespace ignite_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace ignite_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
