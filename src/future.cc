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
#include <vow/future.h>
#include <cassert>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace vow {


future_pending::future_pending()
: std::logic_error("vow::future: not settled")
{}

future_pending::~future_pending() noexcept {}


empty_reason::empty_reason()
: std::runtime_error("vow::future: rejected without a reason")
{}

empty_reason::~empty_reason() noexcept {}


chaining_cycle::chaining_cycle()
: std::logic_error("vow::future: future cannot adopt itself")
{}

chaining_cycle::~chaining_cycle() noexcept {}


namespace impl {


void throw_errc(std::future_errc ec) {
  throw std::future_error(ec);
}


future_state_base::future_state_base(std::shared_ptr<scheduler> sched)
: state_(settle_state::pending),
  sched_(std::move(sched))
{
  if (_predict_false(sched_ == nullptr))
    throw std::invalid_argument("vow::future: null scheduler");
}

future_state_base::~future_state_base() noexcept {}

auto future_state_base::defer(scheduler::task t) const -> void {
  sched_->schedule(std::move(t));
}

auto future_state_base::mark_fulfilled() noexcept -> void {
  assert(state_ == settle_state::pending);
  state_ = settle_state::fulfilled;
}

auto future_state_base::mark_rejected(std::exception_ptr e) noexcept ->
    void {
  assert(state_ == settle_state::pending);
  reason_ = std::move(e);
  state_ = settle_state::rejected;
}

auto future_state_base::settle_rejected(std::exception_ptr e) -> bool {
  if (state_ != settle_state::pending) return false;

  mark_rejected(std::move(e));
  return true;
}

auto future_state_base::followed_by(const future_state_base* s) const ->
    bool {
  std::vector<const future_state_base*> todo{ this };
  std::unordered_set<const future_state_base*> seen{ this };
  std::vector<const future_state_base*> found;

  while (!todo.empty()) {
    const future_state_base* st = todo.back();
    todo.pop_back();
    if (st == s) return true;

    found.clear();
    st->adopters(found);
    for (const future_state_base* a : found) {
      if (seen.insert(a).second) todo.push_back(a);
    }
  }
  return false;
}

auto future_state_base::drain(std::shared_ptr<future_state_base> st) ->
    void {
  std::vector<std::shared_ptr<future_state_base>> stack;
  stack.push_back(std::move(st));

  while (!stack.empty()) {
    std::shared_ptr<future_state_base> next;
    if (!stack.back()->drain_one(next))
      stack.pop_back();
    else if (next)
      stack.push_back(std::move(next));
  }
}

auto future_state_base::throw_reason() const -> void {
  assert(state_ == settle_state::rejected);
  if (!reason_) throw empty_reason();
  std::rethrow_exception(reason_);
}


} /* namespace vow::impl */


rejecter::rejecter(std::shared_ptr<impl::future_state_base> s) noexcept
: state_(std::move(s))
{}

auto rejecter::operator()() const -> void {
  state_->reject(std::exception_ptr());
}

auto rejecter::operator()(std::exception_ptr e) const -> void {
  state_->reject(std::move(e));
}


} /* namespace vow */
