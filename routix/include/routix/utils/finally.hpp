//
// Created by Aiziboy on 2025/12/8.
//

#ifndef ROUTIX_FINALLY_HPP
#define ROUTIX_FINALLY_HPP

#include <type_traits>
#include <utility>

/**
 * @brief 作用域退出时执行一个动作 (例如归还计数器)。
 * @code
 * ++counter;
 * [[maybe_unused]] auto guard = Finally([&] { --counter; });
 * @endcode
 * 动作必须是 noexcept 的，析构函数里不处理异常。
 */
template<typename Func>
struct [[nodiscard]] Finally {
    static_assert(std::is_nothrow_invocable_v<Func>, "Finally action must be noexcept");

    explicit Finally(Func&& f) noexcept : func(std::move(f)) {}

    Finally(Finally&& other) noexcept : func(std::move(other.func)), active(other.active) {
        other.active = false;
    }

    ~Finally() noexcept {
        if (active) func();
    }

    // 解除，不再执行动作
    void release() noexcept {
        active = false;
    }

    Finally(const Finally&) = delete;
    Finally& operator=(const Finally&) = delete;
    Finally& operator=(Finally&&) = delete;

private:
    Func func;
    bool active = true;
};

#endif //ROUTIX_FINALLY_HPP
