/*
 * Copyright (c) 2014 Ariane van der Steldt <ariane@stack.nl>
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
#ifndef VOW_DETAIL_VALUE_SLOT_H
#define VOW_DETAIL_VALUE_SLOT_H

#include <cassert>
#include <functional>
#include <new>
#include <type_traits>
#include <utility>

namespace vow {
namespace impl {


/*
 * Storage for the value of a fulfilled future.
 *
 * The slot starts out empty and is filled at most once.
 */
template<typename T>
class value_slot {
 public:
  using callback = std::function<void(const T&)>;
  using const_reference = const T&;

  value_slot() noexcept : present_(false) {}
  value_slot(const value_slot&) = delete;
  value_slot& operator=(const value_slot&) = delete;

  ~value_slot() noexcept {
    if (present_) ptr_()->~T();
  }

  template<typename... Args>
  void emplace(Args&&... args) {
    assert(!present_);
    new (static_cast<void*>(&storage_)) T(std::forward<Args>(args)...);
    present_ = true;
  }

  void assign_from(const value_slot& o) { emplace(o.get()); }

  const T& get() const noexcept {
    assert(present_);
    return *ptr_();
  }

  void apply(const callback& fn) const { fn(get()); }

 private:
  T* ptr_() noexcept { return static_cast<T*>(static_cast<void*>(&storage_)); }
  const T* ptr_() const noexcept {
    return static_cast<const T*>(static_cast<const void*>(&storage_));
  }

  std::aligned_union_t<0, T> storage_;
  bool present_;
};

template<>
class value_slot<void> {
 public:
  using callback = std::function<void()>;
  using const_reference = void;

  value_slot() noexcept = default;
  value_slot(const value_slot&) = delete;
  value_slot& operator=(const value_slot&) = delete;

  void emplace() noexcept {}
  void assign_from(const value_slot&) noexcept {}
  void get() const noexcept {}
  void apply(const callback& fn) const { fn(); }
};


}} /* namespace vow::impl */

#endif /* VOW_DETAIL_VALUE_SLOT_H */
