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
#include <vow/scheduler.h>
#include <utility>

namespace vow {
namespace {


std::mutex default_mtx;
std::shared_ptr<scheduler> default_sched;


} /* namespace vow::<unnamed> */


scheduler_error::scheduler_error(const std::string& s)
: std::runtime_error(s)
{}

scheduler_error::scheduler_error(const char* s)
: std::runtime_error(s)
{}

scheduler_error::~scheduler_error() noexcept {}


scheduler::~scheduler() noexcept {}


/* Marks the queue as draining, refusing nested drains. */
class task_queue::run_guard {
 public:
  run_guard(const run_guard&) = delete;
  run_guard& operator=(const run_guard&) = delete;

  explicit run_guard(task_queue& q)
  : q_(q)
  {
    std::lock_guard<std::mutex> lck{ q_.mtx_ };
    if (_predict_false(q_.running_))
      throw scheduler_error("task_queue: drained from within one of its tasks");
    q_.running_ = true;
  }

  ~run_guard() noexcept {
    std::lock_guard<std::mutex> lck{ q_.mtx_ };
    q_.running_ = false;
  }

 private:
  task_queue& q_;
};


task_queue::task_queue()
: running_(false)
{}

task_queue::~task_queue() noexcept {}

auto task_queue::schedule(task t) -> void {
  if (_predict_false(!t))
    throw std::invalid_argument("task_queue: empty task");

  std::lock_guard<std::mutex> lck{ mtx_ };
  tasks_.push_back(std::move(t));
}

auto task_queue::pop_() -> task {
  std::lock_guard<std::mutex> lck{ mtx_ };
  if (tasks_.empty()) return task();

  task t = std::move(tasks_.front());
  tasks_.pop_front();
  return t;
}

auto task_queue::run_one() -> bool {
  run_guard guard{ *this };

  task t = pop_();
  if (!t) return false;
  t();
  return true;
}

auto task_queue::run() -> std::size_t {
  run_guard guard{ *this };
  std::size_t count = 0;

  /* Tasks scheduled by a running task are picked up by the same loop. */
  for (task t = pop_(); t; t = pop_()) {
    t();
    ++count;
  }
  return count;
}

auto task_queue::empty() const noexcept -> bool {
  std::lock_guard<std::mutex> lck{ mtx_ };
  return tasks_.empty();
}

auto task_queue::size() const noexcept -> std::size_t {
  std::lock_guard<std::mutex> lck{ mtx_ };
  return tasks_.size();
}


auto global_task_queue() -> std::shared_ptr<task_queue> {
  static const std::shared_ptr<task_queue> q = std::make_shared<task_queue>();
  return q;
}

auto default_scheduler() -> std::shared_ptr<scheduler> {
  {
    std::lock_guard<std::mutex> lck{ default_mtx };
    if (default_sched) return default_sched;
  }
  return global_task_queue();
}

auto set_default_scheduler(std::shared_ptr<scheduler> s) ->
    std::shared_ptr<scheduler> {
  std::lock_guard<std::mutex> lck{ default_mtx };
  std::swap(default_sched, s);
  return s;
}


default_scheduler_guard::default_scheduler_guard(
    std::shared_ptr<scheduler> s)
: prev_(set_default_scheduler(std::move(s)))
{}

default_scheduler_guard::~default_scheduler_guard() noexcept {
  set_default_scheduler(std::move(prev_));
}


} /* namespace vow */
