//
// Created by Aiziboy on 2025/12/8.
//

#ifndef ROUTIX_THREAD_UTILS_HPP
#define ROUTIX_THREAD_UTILS_HPP

#include <string>

#if defined(__linux__) || defined(__APPLE__)
    #include <pthread.h>
#endif

namespace ThreadUtils {

    /**
     * @brief 为当前线程设置一个可调试的名称 (top / gdb 中可见)。
     * @param name 线程的名称。在 Linux 上，名字长度会被截断为 15 个字符。
     */
    inline void set_current_thread_name(const std::string& name) {
#if defined(__linux__)
        // pthread_setname_np 要求名字长度不能超过 16 字节（包括结尾的 \0）
        const std::string short_name = name.substr(0, 15);
        pthread_setname_np(pthread_self(), short_name.c_str());
#elif defined(__APPLE__)
        pthread_setname_np(name.substr(0, 15).c_str());
#else
        (void)name;
#endif
    }

} // namespace ThreadUtils

#endif //ROUTIX_THREAD_UTILS_HPP
