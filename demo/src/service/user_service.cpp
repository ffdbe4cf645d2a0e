//
// Created by Aiziboy on 2025/12/10.
//

#include "user_service.hpp"

#include <ranges>
#include <spdlog/spdlog.h>

namespace demo {

    boost::asio::awaitable<std::optional<User>> UserService::get_user(const int64_t id) const {
        std::lock_guard lock(mutex_);
        const auto it = users_.find(id);
        if (it == users_.end()) {
            co_return std::nullopt;
        }
        co_return it->second;
    }

    boost::asio::awaitable<std::vector<User>> UserService::list_users(const std::size_t limit) const {
        std::vector<User> out;
        std::lock_guard lock(mutex_);
        for (const auto& user : users_ | std::views::values) {
            if (out.size() >= limit) break;
            out.push_back(user);
        }
        co_return out;
    }

    boost::asio::awaitable<bool> UserService::save_user(User user) {
        SPDLOG_DEBUG("保存用户 id: {}，name: {}", user.id, user.name);
        std::lock_guard lock(mutex_);
        const auto [it, inserted] = users_.insert_or_assign(user.id, std::move(user));
        co_return inserted;
    }

    boost::asio::awaitable<bool> UserService::remove_user(const int64_t id) {
        std::lock_guard lock(mutex_);
        co_return users_.erase(id) > 0;
    }

} // namespace demo
