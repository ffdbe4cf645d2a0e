//
// Created by Aiziboy on 2025/12/10.
//

#ifndef DEMO_USER_SERVICE_HPP
#define DEMO_USER_SERVICE_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>
#include <boost/asio/awaitable.hpp>

#include "model/User.hpp"

namespace demo {

    /// 内存中的用户表，多个 IO 线程并发访问
    class UserService {
    public:
        boost::asio::awaitable<std::optional<User>> get_user(int64_t id) const;
        boost::asio::awaitable<std::vector<User>> list_users(std::size_t limit) const;

        /// 创建或覆盖，返回 true 表示新建
        boost::asio::awaitable<bool> save_user(User user);

        boost::asio::awaitable<bool> remove_user(int64_t id);

    private:
        mutable std::mutex mutex_;
        std::map<int64_t, User> users_;
    };

} // namespace demo

#endif //DEMO_USER_SERVICE_HPP
