#ifndef VOW_TEST_TEST_H
#define VOW_TEST_TEST_H

#include <vow/future.h>
#include <vow/scheduler.h>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

inline void test(bool predicate, const std::string& file,
                 const std::string& func, const int line,
                 const std::string& msg) noexcept {
  if (!predicate) {
    std::cerr << "Test failure at " << func << "() in "
              << file << ":" << line << "\n" << msg << std::endl;
    std::terminate();
  }
}

#define test(pred, msg)                                                 \
            test((pred), __FILE__, __func__, __LINE__, (msg))


/* Describe a rejection reason. */
inline std::string describe(const std::exception_ptr& e) {
  if (!e) return "<empty>";

  try {
    std::rethrow_exception(e);
  } catch (const std::string& s) {
    return s;
  } catch (const std::exception& x) {
    return x.what();
  } catch (int i) {
    return std::to_string(i);
  } catch (...) {
    return "<unknown>";
  }
}


/* A pending future together with its capabilities. */
template<typename T>
struct open_future {
  explicit open_future(std::shared_ptr<vow::scheduler> sched)
  : fut(std::move(sched),
        [this](vow::fulfiller<T> ok, vow::rejecter fail) {
          this->ok.reset(new vow::fulfiller<T>(std::move(ok)));
          this->fail.reset(new vow::rejecter(std::move(fail)));
        })
  {}

  std::unique_ptr<vow::fulfiller<T>> ok;
  std::unique_ptr<vow::rejecter> fail;
  vow::future<T> fut;
};

#endif /* VOW_TEST_TEST_H */
