/*
 * Copyright (c) 2014, 2015 Ariane van der Steldt <ariane@stack.nl>
 *
 * Permission to use, copy, modify, and distribute this software for any
 * purpose with or without fee is hereby granted, provided that the above
 * copyright notice and this permission notice appear in all copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
 * WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
 * MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
 * ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
 * WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN
 * ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
 * OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
 */
#ifndef VOW_FUTURE_H
#define VOW_FUTURE_H

#include <vow/vow_export.h>
#include <vow/scheduler.h>
#include <vow/detail/value_slot.h>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace vow {


template<typename> class future;
template<typename> class fulfiller;
template<typename> class thenable;
class rejecter;


using std::future_errc;
using std::future_error;

enum class settle_state {
  pending,
  fulfilled,
  rejected
};


/* get() was called before the future settled. */
class VOW_ASYNC_EXPORT future_pending
: public std::logic_error
{
 public:
  future_pending();
  ~future_pending() noexcept override;
};

/* get() on a future that was rejected without a reason. */
class VOW_ASYNC_EXPORT empty_reason
: public std::runtime_error
{
 public:
  empty_reason();
  ~empty_reason() noexcept override;
};

/* Rejection reason of a future that was asked to adopt itself. */
class VOW_ASYNC_EXPORT chaining_cycle
: public std::logic_error
{
 public:
  chaining_cycle();
  ~chaining_cycle() noexcept override;
};


/*
 * Placeholder for an absent continuation.
 *
 * f.then(no_handler, on_rejected) forwards the value unchanged,
 * f.then(on_fulfilled, no_handler) forwards the reason unchanged.
 */
struct no_handler_t {
  constexpr no_handler_t() noexcept {}
};

constexpr no_handler_t no_handler{};


/*
 * Future-like interface.
 *
 * Anything that can report an eventual value of type T (or a rejection)
 * to a pair of callbacks can be adopted by a future.  The callbacks are
 * invoked at most once, and only one of them is invoked.
 */
template<typename T>
class thenable {
 public:
  using value_type = T;
  using value_callback = typename impl::value_slot<T>::callback;
  using reason_callback = std::function<void(const std::exception_ptr&)>;

  thenable() noexcept = default;
  thenable(const thenable&) noexcept = default;
  thenable& operator=(const thenable&) noexcept = default;
  virtual ~thenable() noexcept = default;

  virtual void chain(value_callback, reason_callback) = 0;
};


namespace impl {

VOW_ASYNC_EXPORT void throw_errc(std::future_errc)
    __attribute__((__noreturn__));

class future_state_base;
template<typename> class future_state;

template<typename...> struct make_void { using type = void; };
template<typename... T> using void_t = typename make_void<T...>::type;

template<typename X, typename = void>
struct is_thenable : std::false_type {};
template<typename X>
struct is_thenable<X, void_t<typename X::value_type>>
: std::is_base_of<thenable<typename X::value_type>, X> {};

template<typename> struct is_future_like : std::false_type {};
template<typename U> struct is_future_like<future<U>> : std::true_type {};
template<typename X> struct is_future_like<std::shared_ptr<X>>
: is_thenable<X> {};

template<typename D>
using is_plain_reason = std::integral_constant<bool,
    !is_future_like<D>::value &&
    !std::is_same<D, std::exception_ptr>::value &&
    !std::is_same<D, std::nullptr_t>::value>;

/* Value type of a future that settles with an R. */
template<typename R, typename = void>
struct unwrap_future { using type = R; };
template<typename U>
struct unwrap_future<future<U>, void> { using type = U; };
template<typename X>
struct unwrap_future<std::shared_ptr<X>,
                     std::enable_if_t<is_thenable<X>::value>> {
  using type = typename X::value_type;
};

template<typename T, typename Fn>
struct value_result {
  using type = decltype(std::declval<Fn&>()(std::declval<const T&>()));
};
template<typename Fn>
struct value_result<void, Fn> {
  using type = decltype(std::declval<Fn&>()());
};

template<typename T, typename Fn>
struct then_result {
  using type = typename unwrap_future<
      std::decay_t<typename value_result<T, Fn>::type>>::type;
};
template<typename T>
struct then_result<T, no_handler_t> {
  using type = T;
};

template<typename T, typename Fn> using then_result_t =
    typename then_result<T, Fn>::type;

} /* namespace vow::impl */


/*
 * Settles a future with a value.
 *
 * Only handed to the initializer of a future.  Calls after the future
 * settled have no effect.  Passing a future (or other thenable) makes the
 * future follow that object instead.
 */
template<typename T>
class fulfiller {
  friend future<T>;

 public:
  void operator()(const T&) const;
  void operator()(T&&) const;
  void operator()(const future<T>&) const;
  void operator()(std::shared_ptr<thenable<T>>) const;

 private:
  explicit fulfiller(std::shared_ptr<impl::future_state<T>>) noexcept;

  std::shared_ptr<impl::future_state<T>> state_;
};

template<>
class fulfiller<void> {
  friend future<void>;

 public:
  void operator()() const;
  void operator()(const future<void>&) const;
  void operator()(std::shared_ptr<thenable<void>>) const;

 private:
  explicit fulfiller(std::shared_ptr<impl::future_state<void>>) noexcept;

  std::shared_ptr<impl::future_state<void>> state_;
};


/*
 * Settles a future with a rejection reason.
 *
 * Without arguments, the reason is an empty exception_ptr.  Values other
 * than exception_ptr are wrapped using std::make_exception_ptr.
 *
 * A future (or other thenable) as argument is followed: whatever it
 * settles with becomes the rejection reason of this future.
 */
class VOW_ASYNC_EXPORT rejecter {
  template<typename> friend class future;

 public:
  void operator()() const;
  void operator()(std::exception_ptr) const;

  template<typename E>
  auto operator()(E&&) const ->
      std::enable_if_t<impl::is_future_like<std::decay_t<E>>::value>;
  template<typename E>
  auto operator()(E&&) const ->
      std::enable_if_t<impl::is_plain_reason<std::decay_t<E>>::value>;

 private:
  explicit rejecter(std::shared_ptr<impl::future_state_base>) noexcept;

  template<typename U>
  static std::shared_ptr<thenable<U>> thenable_of_(const future<U>&);
  template<typename X>
  static std::shared_ptr<thenable<typename X::value_type>> thenable_of_(
      const std::shared_ptr<X>&) noexcept;

  template<typename U> void adopt_(std::shared_ptr<thenable<U>>) const;

  std::shared_ptr<impl::future_state_base> state_;
};


/*
 * A deferred value.
 *
 * The initializer is invoked during construction with a fulfiller<T> and
 * a rejecter, which settle the future.  Continuations attached with then,
 * catch_error and finally run synchronously when the future settles, or
 * through the future's scheduler if it had already settled when they were
 * attached.  Each of them returns a new future for the continuation's
 * outcome.
 *
 * Copies of a future refer to the same state.
 */
template<typename T>
class future {
  template<typename> friend class future;
  friend fulfiller<T>;
  friend rejecter;

 public:
  using value_type = T;
  using const_reference = typename impl::value_slot<T>::const_reference;

  future() noexcept = default;
  template<typename Init,
           typename = std::enable_if_t<
               !std::is_same<std::decay_t<Init>, future>::value>>
  explicit future(Init&&);
  template<typename Init> future(std::shared_ptr<scheduler>, Init&&);

  future(const future&) = default;
  future(future&&) noexcept = default;
  future& operator=(const future&) = default;
  future& operator=(future&&) noexcept = default;
  ~future() noexcept = default;

  bool valid() const noexcept;
  settle_state state() const;
  const_reference get() const;
  std::exception_ptr reason() const;
  std::shared_ptr<scheduler> get_scheduler() const;

  template<typename OnFulfilled = no_handler_t,
           typename OnRejected = no_handler_t>
  auto then(OnFulfilled = OnFulfilled(), OnRejected = OnRejected()) const ->
      future<impl::then_result_t<T, OnFulfilled>>;

  template<typename OnRejected = no_handler_t>
  auto catch_error(OnRejected = OnRejected()) const -> future;

  template<typename OnFinally>
  auto finally(OnFinally) const -> future;

 private:
  const std::shared_ptr<impl::future_state<T>>& state_ptr_() const;

  std::shared_ptr<impl::future_state<T>> state_;
};


template<typename T>
auto make_fulfilled_future(T&&) -> future<std::decay_t<T>>;
inline auto make_fulfilled_future() -> future<void>;
template<typename T>
auto make_rejected_future(std::exception_ptr) -> future<T>;


} /* namespace vow */

#include <vow/future-inl.h>

#endif /* VOW_FUTURE_H */
