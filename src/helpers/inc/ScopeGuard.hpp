#ifndef REBIND_HELPERS_SCOPE_GUARD_HPP
#define REBIND_HELPERS_SCOPE_GUARD_HPP
/**
 * @file ScopeGuard.hpp
 * @brief Run a callable when the enclosing scope exits.
 *
 * The callable runs on normal exit, early return and stack unwinding alike.
 * It must not throw; the guard destructor is noexcept.
 */

#include <concepts>
#include <type_traits>
#include <utility>

namespace rebind {
namespace helpers {

/* ----------------------------- ScopeGuard ----------------------------- */

/**
 * @brief Movable, non-copyable exit action.
 * @tparam Callable Decayed callable invocable with no arguments.
 */
template <typename Callable>
  requires std::invocable<Callable&>
class ScopeGuard {
public:
  static_assert(!std::is_reference_v<Callable>, "ScopeGuard stores the callable by value");

  explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
      : fn_(std::move(fn)) {}

  ScopeGuard(ScopeGuard&& other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
      : fn_(std::move(other.fn_)), active_(other.active_) {
    other.dismiss();
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() noexcept {
    if (active_) {
      fn_();
    }
  }

  /// Cancel the exit action.
  void dismiss() noexcept { active_ = false; }

  /// True while the action is still armed.
  [[nodiscard]] bool active() const noexcept { return active_; }

private:
  Callable fn_;
  bool active_{true};
};

/**
 * @brief Create a ScopeGuard with the callable type deduced and decayed.
 */
template <typename Callable>
[[nodiscard]] auto makeScopeGuard(Callable&& fn) {
  return ScopeGuard<std::decay_t<Callable>>(std::forward<Callable>(fn));
}

} // namespace helpers
} // namespace rebind

#endif // REBIND_HELPERS_SCOPE_GUARD_HPP
