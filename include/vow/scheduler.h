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
#ifndef VOW_SCHEDULER_H
#define VOW_SCHEDULER_H

#include <vow/vow_export.h>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace vow {


class VOW_ASYNC_EXPORT scheduler_error
: public std::runtime_error
{
 public:
  explicit scheduler_error(const std::string&);
  explicit scheduler_error(const char*);
  ~scheduler_error() noexcept override;
};


/*
 * Deferred execution service.
 *
 * A scheduler runs each task exactly once, after the code that submitted
 * it has unwound, in the order the tasks were submitted.
 */
class VOW_ASYNC_EXPORT scheduler {
 public:
  using task = std::function<void()>;

  scheduler() noexcept = default;
  scheduler(const scheduler&) = delete;
  scheduler& operator=(const scheduler&) = delete;
  virtual ~scheduler() noexcept;

  virtual void schedule(task) = 0;
};


/*
 * FIFO task queue, drained explicitly by its owner.
 *
 * Tasks may be submitted from any thread, but the queue must be drained
 * from a single thread at a time.
 */
class VOW_ASYNC_EXPORT task_queue final
: public scheduler
{
 public:
  task_queue();
  ~task_queue() noexcept override;

  void schedule(task) override;

  bool run_one();
  std::size_t run();

  bool empty() const noexcept;
  std::size_t size() const noexcept;

 private:
  class run_guard;

  task pop_();

  mutable std::mutex mtx_;
  std::deque<task> tasks_;
  bool running_;
};


VOW_ASYNC_EXPORT std::shared_ptr<task_queue> global_task_queue();
VOW_ASYNC_EXPORT std::shared_ptr<scheduler> default_scheduler();
VOW_ASYNC_EXPORT std::shared_ptr<scheduler> set_default_scheduler(
    std::shared_ptr<scheduler>);


/* Install a default scheduler for the lifetime of the guard. */
class VOW_ASYNC_EXPORT default_scheduler_guard {
 public:
  explicit default_scheduler_guard(std::shared_ptr<scheduler>);
  default_scheduler_guard(const default_scheduler_guard&) = delete;
  default_scheduler_guard& operator=(const default_scheduler_guard&) = delete;
  ~default_scheduler_guard() noexcept;

 private:
  std::shared_ptr<scheduler> prev_;
};


} /* namespace vow */

#endif /* VOW_SCHEDULER_H */
