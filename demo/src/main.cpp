//
// Created by Aiziboy on 2025/12/10.
//

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <unordered_map>

#include <routix/App.hpp>
#include <routix/http/request_context.hpp>
#include <routix/utils/logger_manager.hpp>

#include "controller/UserController.hpp"
#include "guard/ApiKeyGuard.hpp"
#include "service/user_service.hpp"

using routix::RequestContext;
namespace route = routix::route;

int main(int argc, char* argv[]) {
    int code = 0;
    try {
        // 1. 初始化容器
        routix::App app(argc > 1 ? argv[1] : "config.toml");

        // 2. 组装业务
        const char* env_key = std::getenv("ROUTIX_DEMO_API_KEY");
        const auto auth_guard = std::make_shared<const demo::ApiKeyGuard>(
            std::unordered_map<std::string, std::string>{{env_key ? env_key : "demo-key", "demo"}});

        const auto user_service = std::make_shared<demo::UserService>();
        const auto user_controller = std::make_shared<demo::UserController>(user_service, auth_guard);

        // 3. 注册路由
        app.addRoutes({
            route::get("/", [](RequestContext& ctx) -> boost::asio::awaitable<void> {
                ctx.string("routix demo");
                co_return;
            }),
            route::get("/hello", [](RequestContext& ctx) -> boost::asio::awaitable<void> {
                const auto name = ctx.queries().get_or_default<std::string>("name", "world");
                ctx.string("Hello, " + name + "!");
                co_return;
            }),
            route::fallback([](RequestContext& ctx) -> boost::asio::awaitable<void> {
                ctx.json(http::status::not_found, R"({"code":404,"message":"no such route"})");
                co_return;
            }),
        });
        app.addController(user_controller);

        // 4. 启动 (阻塞直到退出信号)
        code = app.run();
    } catch (const std::exception& e) {
        // 构造阶段的异常 (比如配置文件不存在)
        std::fprintf(stderr, "Critical Error during startup: %s\n", e.what());
        code = 1;
    }
    // App 析构之后再关闭日志
    routix::LoggerManager::shutdown();
    return code;
}
