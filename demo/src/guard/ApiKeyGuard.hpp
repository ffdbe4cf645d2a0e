//
// Created by Aiziboy on 2025/12/10.
//

#ifndef DEMO_API_KEY_GUARD_HPP
#define DEMO_API_KEY_GUARD_HPP

#include <string>
#include <unordered_map>

#include <routix/http/handler.hpp>

namespace demo {

    /**
     * @brief 校验 X-Api-Key 请求头。
     * 通过时把 Principal 放进请求扩展槽，失败时直接响应 401。
     */
    class ApiKeyGuard final : public routix::Guard {
    public:
        /// key -> 使用者名称
        explicit ApiKeyGuard(std::unordered_map<std::string, std::string> keys);

        boost::asio::awaitable<routix::ControlFlow> invoke(routix::RequestContext& ctx) const override;

    private:
        std::unordered_map<std::string, std::string> keys_;
    };

} // namespace demo

#endif //DEMO_API_KEY_GUARD_HPP
