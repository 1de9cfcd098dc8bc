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
#ifndef VOW_FUTURE_INL_H
#define VOW_FUTURE_INL_H

#include <vow/future.h>
#include <vow/scheduler.h>
#include <vow/detail/value_slot.h>
#include <cstddef>
#include <exception>
#include <memory>
#include <utility>
#include <vector>

namespace vow {
namespace impl {


inline auto as_reason() -> std::exception_ptr {
  return std::exception_ptr();
}

inline auto as_reason(const std::exception_ptr& e) -> std::exception_ptr {
  return e;
}

template<typename U>
auto as_reason(const U& v) -> std::exception_ptr {
  try {
    return std::make_exception_ptr(v);
  } catch (...) {
    return std::current_exception();
  }
}

template<typename U>
auto reason_of(const value_slot<U>& slot) -> std::exception_ptr {
  return as_reason(slot.get());
}

inline auto reason_of(const value_slot<void>&) -> std::exception_ptr {
  return std::exception_ptr();
}


/*
 * Type independent part of the future state.
 *
 * Holds the settle state, the rejection reason and the scheduler that
 * late continuations are deferred to.
 */
class VOW_ASYNC_EXPORT future_state_base {
 protected:
  future_state_base() = delete;
  explicit future_state_base(std::shared_ptr<scheduler>);

 public:
  future_state_base(const future_state_base&) = delete;
  future_state_base(future_state_base&&) = delete;
  future_state_base& operator=(const future_state_base&) = delete;
  future_state_base& operator=(future_state_base&&) = delete;
  virtual ~future_state_base() noexcept;

  settle_state get_state() const noexcept { return state_; }
  const std::exception_ptr& get_reason() const noexcept { return reason_; }
  const std::shared_ptr<scheduler>& get_scheduler() const noexcept {
    return sched_;
  }

  virtual void reject(std::exception_ptr) = 0;

  /* Mark rejected without running listeners; false if already settled. */
  bool settle_rejected(std::exception_ptr);
  /* True if s is this state, or adopts it (directly or indirectly). */
  bool followed_by(const future_state_base* s) const;

  /*
   * Run all listeners of a just settled state.
   *
   * Adopters settled by a listener have their own listeners run before
   * the next listener of the adopted state.  This is done with an
   * explicit stack, so long adoption chains don't recurse.
   */
  static void drain(std::shared_ptr<future_state_base>);

 protected:
  void defer(scheduler::task) const;
  void mark_fulfilled() noexcept;
  void mark_rejected(std::exception_ptr) noexcept;
  void throw_reason() const __attribute__((__noreturn__));

  /* Run the next listener, returning a newly settled adopter in next. */
  virtual bool drain_one(std::shared_ptr<future_state_base>& next) = 0;
  virtual void adopters(std::vector<const future_state_base*>&) const = 0;

 private:
  settle_state state_;
  std::exception_ptr reason_;
  const std::shared_ptr<scheduler> sched_;
};


template<typename T>
class future_state final
: public future_state_base,
  public thenable<T>,
  public std::enable_shared_from_this<future_state<T>>
{
 public:
  using value_callback = typename thenable<T>::value_callback;
  using reason_callback = typename thenable<T>::reason_callback;

  explicit future_state(std::shared_ptr<scheduler>);
  ~future_state() noexcept override;

  template<typename... Args> void fulfill(Args&&...);
  void adopt(const std::shared_ptr<future_state>&);
  void adopt(const std::shared_ptr<thenable<T>>&);
  void add_reason_adopter(std::shared_ptr<future_state_base>);
  void reject(std::exception_ptr) override;
  void chain(value_callback, reason_callback) override;

  typename value_slot<T>::const_reference get() const;

 private:
  /*
   * A pair of continuations, or a future that follows this one.
   * An adopter takes the outcome as is, a reason adopter is rejected
   * with it.
   */
  struct listener {
    value_callback on_value;
    reason_callback on_reason;
    std::shared_ptr<future_state> adopter;
    std::shared_ptr<future_state_base> reason_adopter;
  };

  void add_adopter(std::shared_ptr<future_state>);
  bool settle_from(const future_state&);
  std::exception_ptr outcome_as_reason() const;
  bool drain_one(std::shared_ptr<future_state_base>&) override;
  void adopters(std::vector<const future_state_base*>&) const override;

  value_slot<T> value_;
  std::vector<listener> listeners_;
  std::size_t drained_;
};


template<typename T>
future_state<T>::future_state(std::shared_ptr<scheduler> sched)
: future_state_base(std::move(sched)),
  drained_(0)
{}

template<typename T>
future_state<T>::~future_state() noexcept {}

/* A value that fails to copy rejects the future instead. */
template<typename T>
template<typename... Args>
auto future_state<T>::fulfill(Args&&... args) -> void {
  if (this->get_state() != settle_state::pending) return;

  try {
    value_.emplace(std::forward<Args>(args)...);
  } catch (...) {
    reject(std::current_exception());
    return;
  }
  this->mark_fulfilled();
  drain(this->shared_from_this());
}

template<typename T>
auto future_state<T>::adopt(const std::shared_ptr<future_state>& inner) ->
    void {
  if (_predict_false(this->followed_by(inner.get()))) {
    reject(std::make_exception_ptr(chaining_cycle()));
    return;
  }

  inner->add_adopter(this->shared_from_this());
}

template<typename T>
auto future_state<T>::adopt(const std::shared_ptr<thenable<T>>& t) -> void {
  if (auto own = std::dynamic_pointer_cast<future_state>(t)) {
    adopt(own);
    return;
  }

  std::shared_ptr<future_state> self = this->shared_from_this();
  t->chain(
      [self](const auto&... v) {
        self->fulfill(v...);
      },
      [self](const std::exception_ptr& e) {
        self->reject(e);
      });
}

template<typename T>
auto future_state<T>::add_reason_adopter(
    std::shared_ptr<future_state_base> a) -> void {
  if (this->get_state() == settle_state::pending) {
    listeners_.push_back(
        listener{ value_callback(), reason_callback(), nullptr, std::move(a) });
    return;
  }

  std::shared_ptr<future_state> self = this->shared_from_this();
  this->defer([self, a]() {
        if (a->settle_rejected(self->outcome_as_reason())) drain(a);
      });
}

template<typename T>
auto future_state<T>::reject(std::exception_ptr e) -> void {
  if (this->get_state() != settle_state::pending) return;

  this->mark_rejected(std::move(e));
  drain(this->shared_from_this());
}

template<typename T>
auto future_state<T>::chain(value_callback on_value,
                            reason_callback on_reason) -> void {
  switch (this->get_state()) {
  case settle_state::pending:
    listeners_.push_back(listener{ std::move(on_value), std::move(on_reason),
                                   nullptr, nullptr });
    break;
  case settle_state::fulfilled:
    {
      std::shared_ptr<future_state> self = this->shared_from_this();
      this->defer([self, on_value]() {
            self->value_.apply(on_value);
          });
    }
    break;
  case settle_state::rejected:
    {
      std::exception_ptr reason = this->get_reason();
      this->defer([reason, on_reason]() {
            on_reason(reason);
          });
    }
    break;
  }
}

template<typename T>
auto future_state<T>::get() const ->
    typename value_slot<T>::const_reference {
  switch (this->get_state()) {
  case settle_state::pending:
    throw future_pending();
  case settle_state::rejected:
    this->throw_reason();
  case settle_state::fulfilled:
    break;
  }
  return value_.get();
}

template<typename T>
auto future_state<T>::add_adopter(std::shared_ptr<future_state> a) -> void {
  if (this->get_state() == settle_state::pending) {
    listeners_.push_back(
        listener{ value_callback(), reason_callback(), std::move(a), nullptr });
    return;
  }

  /* Same delay as a continuation attached to a settled future. */
  std::shared_ptr<future_state> self = this->shared_from_this();
  this->defer([self, a]() {
        if (a->settle_from(*self)) drain(a);
      });
}

/* Copy the outcome of src, unless this is already settled. */
template<typename T>
auto future_state<T>::settle_from(const future_state& src) -> bool {
  if (this->get_state() != settle_state::pending) return false;

  if (src.get_state() == settle_state::fulfilled) {
    try {
      value_.assign_from(src.value_);
    } catch (...) {
      this->mark_rejected(std::current_exception());
      return true;
    }
    this->mark_fulfilled();
  } else {
    this->mark_rejected(src.get_reason());
  }
  return true;
}

template<typename T>
auto future_state<T>::outcome_as_reason() const -> std::exception_ptr {
  if (this->get_state() == settle_state::rejected) return this->get_reason();
  return reason_of(value_);
}

template<typename T>
auto future_state<T>::drain_one(std::shared_ptr<future_state_base>& next) ->
    bool {
  if (drained_ == listeners_.size()) {
    listeners_.clear();
    listeners_.shrink_to_fit();
    drained_ = 0;
    return false;
  }

  listener l = std::move(listeners_[drained_++]);
  if (l.adopter) {
    if (l.adopter->settle_from(*this)) next = std::move(l.adopter);
  } else if (l.reason_adopter) {
    if (l.reason_adopter->settle_rejected(outcome_as_reason()))
      next = std::move(l.reason_adopter);
  } else if (this->get_state() == settle_state::fulfilled) {
    value_.apply(l.on_value);
  } else {
    l.on_reason(this->get_reason());
  }
  return true;
}

template<typename T>
auto future_state<T>::adopters(std::vector<const future_state_base*>& out)
    const -> void {
  for (const listener& l : listeners_) {
    if (l.adopter) out.push_back(l.adopter.get());
    if (l.reason_adopter) out.push_back(l.reason_adopter.get());
  }
}


/* Settle the future behind ok/fail with the outcome of fn(args...). */
template<typename C, typename Fn, typename... Args>
auto settle_result(const fulfiller<C>& ok, Fn& fn, std::true_type,
                   const Args&... args) -> void {
  fn(args...);
  ok();
}

template<typename C, typename Fn, typename... Args>
auto settle_result(const fulfiller<C>& ok, Fn& fn, std::false_type,
                   const Args&... args) -> void {
  ok(fn(args...));
}

template<typename C, typename Fn, typename... Args>
auto settle_with(const fulfiller<C>& ok, const rejecter& fail, Fn& fn,
                 const Args&... args) -> void {
  using result_type = decltype(fn(args...));

  try {
    settle_result(ok, fn, std::is_void<result_type>(), args...);
  } catch (...) {
    fail(std::current_exception());
  }
}

template<typename C, typename Fn, typename... V>
auto on_value_(const fulfiller<C>& ok, const rejecter&, Fn&, std::true_type,
               const V&... v) -> void {
  ok(v...);
}

template<typename C, typename Fn, typename... V>
auto on_value_(const fulfiller<C>& ok, const rejecter& fail, Fn& fn,
               std::false_type, const V&... v) -> void {
  settle_with(ok, fail, fn, v...);
}

template<typename C, typename Fn, typename... V>
auto on_value(const fulfiller<C>& ok, const rejecter& fail, Fn& fn,
              const V&... v) -> void {
  on_value_(ok, fail, fn, std::is_same<std::decay_t<Fn>, no_handler_t>(),
            v...);
}

template<typename C, typename Fn>
auto on_reason_(const fulfiller<C>&, const rejecter& fail, Fn&,
                std::true_type, const std::exception_ptr& e) -> void {
  fail(e);
}

template<typename C, typename Fn>
auto on_reason_(const fulfiller<C>& ok, const rejecter& fail, Fn& fn,
                std::false_type, const std::exception_ptr& e) -> void {
  settle_with(ok, fail, fn, e);
}

template<typename C, typename Fn>
auto on_reason(const fulfiller<C>& ok, const rejecter& fail, Fn& fn,
               const std::exception_ptr& e) -> void {
  on_reason_(ok, fail, fn, std::is_same<std::decay_t<Fn>, no_handler_t>(),
             e);
}

/* Run a finally callback; a throwing callback rejects instead. */
template<typename Fn>
auto run_finally(const rejecter& fail, Fn& fn) -> bool {
  try {
    fn();
  } catch (...) {
    fail(std::current_exception());
    return false;
  }
  return true;
}


} /* namespace vow::impl */


template<typename T>
fulfiller<T>::fulfiller(std::shared_ptr<impl::future_state<T>> s) noexcept
: state_(std::move(s))
{}

template<typename T>
auto fulfiller<T>::operator()(const T& v) const -> void {
  state_->fulfill(v);
}

template<typename T>
auto fulfiller<T>::operator()(T&& v) const -> void {
  state_->fulfill(std::move(v));
}

template<typename T>
auto fulfiller<T>::operator()(const future<T>& f) const -> void {
  state_->adopt(f.state_ptr_());
}

template<typename T>
auto fulfiller<T>::operator()(std::shared_ptr<thenable<T>> t) const -> void {
  if (_predict_false(!t))
    impl::throw_errc(future_errc::no_state);
  state_->adopt(t);
}


inline fulfiller<void>::fulfiller(
    std::shared_ptr<impl::future_state<void>> s) noexcept
: state_(std::move(s))
{}

inline auto fulfiller<void>::operator()() const -> void {
  state_->fulfill();
}

inline auto fulfiller<void>::operator()(const future<void>& f) const ->
    void {
  state_->adopt(f.state_ptr_());
}

inline auto fulfiller<void>::operator()(
    std::shared_ptr<thenable<void>> t) const -> void {
  if (_predict_false(!t))
    impl::throw_errc(future_errc::no_state);
  state_->adopt(t);
}


template<typename E>
auto rejecter::operator()(E&& e) const ->
    std::enable_if_t<impl::is_future_like<std::decay_t<E>>::value> {
  adopt_(thenable_of_(e));
}

template<typename E>
auto rejecter::operator()(E&& e) const ->
    std::enable_if_t<impl::is_plain_reason<std::decay_t<E>>::value> {
  (*this)(std::make_exception_ptr(std::forward<E>(e)));
}

template<typename U>
auto rejecter::thenable_of_(const future<U>& f) ->
    std::shared_ptr<thenable<U>> {
  return f.state_ptr_();
}

template<typename X>
auto rejecter::thenable_of_(const std::shared_ptr<X>& p) noexcept ->
    std::shared_ptr<thenable<typename X::value_type>> {
  return p;
}

template<typename U>
auto rejecter::adopt_(std::shared_ptr<thenable<U>> t) const -> void {
  if (_predict_false(!t))
    impl::throw_errc(future_errc::no_state);

  if (auto own = std::dynamic_pointer_cast<impl::future_state<U>>(t)) {
    if (_predict_false(state_->followed_by(own.get()))) {
      state_->reject(std::make_exception_ptr(chaining_cycle()));
      return;
    }
    own->add_reason_adopter(state_);
    return;
  }

  std::shared_ptr<impl::future_state_base> st = state_;
  t->chain(
      [st](const auto&... v) {
        st->reject(impl::as_reason(v...));
      },
      [st](const std::exception_ptr& e) {
        st->reject(e);
      });
}


template<typename T>
template<typename Init, typename>
future<T>::future(Init&& init)
: future(default_scheduler(), std::forward<Init>(init))
{}

template<typename T>
template<typename Init>
future<T>::future(std::shared_ptr<scheduler> sched, Init&& init)
: state_(std::make_shared<impl::future_state<T>>(std::move(sched)))
{
  std::forward<Init>(init)(fulfiller<T>(state_), rejecter(state_));
}

template<typename T>
auto future<T>::valid() const noexcept -> bool {
  return state_ != nullptr;
}

template<typename T>
auto future<T>::state() const -> settle_state {
  return state_ptr_()->get_state();
}

template<typename T>
auto future<T>::get() const -> const_reference {
  return state_ptr_()->get();
}

template<typename T>
auto future<T>::reason() const -> std::exception_ptr {
  const auto& st = state_ptr_();
  if (st->get_state() != settle_state::rejected) return nullptr;
  return st->get_reason();
}

template<typename T>
auto future<T>::get_scheduler() const -> std::shared_ptr<scheduler> {
  return state_ptr_()->get_scheduler();
}

template<typename T>
template<typename OnFulfilled, typename OnRejected>
auto future<T>::then(OnFulfilled on_fulfilled, OnRejected on_rejected) const
    -> future<impl::then_result_t<T, OnFulfilled>> {
  using result_type = impl::then_result_t<T, OnFulfilled>;
  const auto& st = state_ptr_();

  return future<result_type>(st->get_scheduler(),
      [&](fulfiller<result_type> ok, rejecter fail) {
        st->chain(
            [ok, fail, fn = std::move(on_fulfilled)](const auto&... v)
                mutable {
              impl::on_value(ok, fail, fn, v...);
            },
            [ok, fail, fn = std::move(on_rejected)](
                const std::exception_ptr& e) mutable {
              impl::on_reason(ok, fail, fn, e);
            });
      });
}

template<typename T>
template<typename OnRejected>
auto future<T>::catch_error(OnRejected on_rejected) const -> future {
  const auto& st = state_ptr_();

  return future(st->get_scheduler(),
      [&](fulfiller<T> ok, rejecter fail) {
        st->chain(
            [ok](const auto&... v) {
              ok(v...);
            },
            [ok, fail, fn = std::move(on_rejected)](
                const std::exception_ptr& e) mutable {
              impl::on_reason(ok, fail, fn, e);
            });
      });
}

template<typename T>
template<typename OnFinally>
auto future<T>::finally(OnFinally on_finally) const -> future {
  const auto& st = state_ptr_();

  return future(st->get_scheduler(),
      [&](fulfiller<T> ok, rejecter fail) {
        auto value_cb = [ok, fail, fn = on_finally](const auto&... v)
            mutable {
          if (impl::run_finally(fail, fn)) ok(v...);
        };
        auto reason_cb = [fail, fn = std::move(on_finally)](
            const std::exception_ptr& e) mutable {
          if (impl::run_finally(fail, fn)) fail(e);
        };
        st->chain(std::move(value_cb), std::move(reason_cb));
      });
}

template<typename T>
auto future<T>::state_ptr_() const ->
    const std::shared_ptr<impl::future_state<T>>& {
  if (_predict_false(!state_))
    impl::throw_errc(future_errc::no_state);
  return state_;
}


template<typename T>
auto make_fulfilled_future(T&& v) -> future<std::decay_t<T>> {
  using value_type = std::decay_t<T>;

  return future<value_type>(
      [&v](fulfiller<value_type> ok, rejecter) {
        ok(std::forward<T>(v));
      });
}

inline auto make_fulfilled_future() -> future<void> {
  return future<void>(
      [](fulfiller<void> ok, rejecter) {
        ok();
      });
}

template<typename T>
auto make_rejected_future(std::exception_ptr e) -> future<T> {
  return future<T>(
      [&e](fulfiller<T>, rejecter fail) {
        fail(std::move(e));
      });
}


} /* namespace vow */

#endif /* VOW_FUTURE_INL_H */
