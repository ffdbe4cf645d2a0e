//
// Created by Aiziboy on 2025/12/10.
//

#include "ApiKeyGuard.hpp"

#include <routix/http/request_context.hpp>
#include <spdlog/spdlog.h>

#include "model/User.hpp"

namespace demo {

    ApiKeyGuard::ApiKeyGuard(std::unordered_map<std::string, std::string> keys)
        : keys_(std::move(keys)) {}

    boost::asio::awaitable<routix::ControlFlow> ApiKeyGuard::invoke(routix::RequestContext& ctx) const {
        const auto key = ctx.header("X-Api-Key");
        if (!key) {
            ctx.json(http::status::unauthorized, R"({"code":401,"message":"missing X-Api-Key"})");
            co_return routix::ControlFlow::reject(std::move(ctx.response()));
        }

        const auto it = keys_.find(std::string(*key));
        if (it == keys_.end()) {
            SPDLOG_WARN("无效的 api key，来自 {}", ctx.ip());
            ctx.json(http::status::forbidden, R"({"code":403,"message":"invalid api key"})");
            co_return routix::ControlFlow::reject(std::move(ctx.response()));
        }

        ctx.extensions().insert(Principal{it->first, it->second});
        co_return routix::ControlFlow::next();
    }

} // namespace demo
