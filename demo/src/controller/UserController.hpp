//
// Created by Aiziboy on 2025/12/10.
//

#ifndef DEMO_USER_CONTROLLER_HPP
#define DEMO_USER_CONTROLLER_HPP

#include <memory>
#include <boost/asio/awaitable.hpp>

#include <routix/controller/HttpController.hpp>
#include <routix/http/request_context.hpp>

#include "service/user_service.hpp"

namespace demo {

    /**
     * /api 分组：
     *   GET    /api/users            列表 (?limit=)
     *   GET    /api/users/me         当前 api key 对应的使用者
     *   GET    /api/users/:id
     *   PUT    /api/users/:id        JSON body {"name": "...", "email": "..."}
     *   DELETE /api/users/:id
     *   GET    /api/files/*path
     */
    class UserController final : public routix::HttpController {
    public:
        UserController(std::shared_ptr<UserService> user_service, routix::GuardPtr auth_guard);

        routix::RouteDef routes() override;

    private:
        boost::asio::awaitable<void> list_users(routix::RequestContext& ctx) const;
        boost::asio::awaitable<void> me(routix::RequestContext& ctx) const;
        boost::asio::awaitable<void> get_user(routix::RequestContext& ctx) const;
        boost::asio::awaitable<void> save_user(routix::RequestContext& ctx) const;
        boost::asio::awaitable<void> remove_user(routix::RequestContext& ctx) const;
        boost::asio::awaitable<void> get_file(routix::RequestContext& ctx) const;

        std::shared_ptr<UserService> user_service_;
        routix::GuardPtr auth_guard_;
    };

} // namespace demo

#endif //DEMO_USER_CONTROLLER_HPP
