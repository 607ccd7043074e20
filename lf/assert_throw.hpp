#ifndef lf_assert_throw_hpp
#define lf_assert_throw_hpp

/**
 * Raise lf::internal_error if @a P does not hold.
 *
 * Use it for conditions that only a bug in the library (or a misuse of its threads) can violate.
 */
#define LF_ASSERT_THROW(P)                                                                                             \
  do {                                                                                                                 \
    if (not(P)) {                                                                                                      \
      lf::raise_assertion_failure(#P, __FILE__, __LINE__);                                                             \
    }                                                                                                                  \
  } while (false)

namespace lf {

/// Log and raise lf::internal_error for the failed predicate @a expression.
[[noreturn]] void raise_assertion_failure(char const* expression, char const* file, int line);

} // namespace lf

#endif // lf_assert_throw_hpp
