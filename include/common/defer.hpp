#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 在当前作用域结束时执行代码块，用于释放 C 库句柄
 * @code{.cpp}
 *     CURL *curl = curl_easy_init();
 *     defer { curl_easy_cleanup(curl); };
 * @endcode
 */
#define defer auto DEFER_0(_defered_option) = gradeguard::scoped_guard() + [&]

namespace gradeguard {

struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(const scoped_guard &) = delete;
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace gradeguard
