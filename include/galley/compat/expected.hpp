/**
* @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected (C++20).
 *
 * Every fallible galley operation returns galley_detail::expected<T, E> so the
 * codebase does not depend directly on a specific implementation.
 *
 * - With a standard library that ships <expected>: uses std::expected.
 * - Otherwise: falls back to <tl/expected.hpp>, a header-only backport by
 *   TartanLlama (https://github.com/TartanLlama/expected).
 *
 * Only the common subset is used (has_value, value, error, operator*, ->);
 * the monadic members are not available in every libstdc++ that has <expected>.
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
  #include <expected>
  namespace galley_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace galley_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
