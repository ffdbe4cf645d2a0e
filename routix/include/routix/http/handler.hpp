//
// Created by Aiziboy on 2025/12/4.
//

#ifndef ROUTIX_HANDLER_HPP
#define ROUTIX_HANDLER_HPP

#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>
#include <boost/asio/awaitable.hpp>

#include <routix/http/http_common_types.hpp>

namespace routix {

    /**
     * @brief Guard 的执行结果：放行给下一个链节点，或者中断整条链并直接响应。
     *
     * - ControlFlow::next()：继续执行下一个 Guard / Handler。
     * - ControlFlow::reject(resp)：中断，并以 resp 作为最终响应。
     *
     * 拒绝必须带上响应。已经写好 ctx.response() 的 Guard 可以把它交出来：
     * @code
     * ctx.json(http::status::forbidden, R"({"code":403})");
     * co_return ControlFlow::reject(std::move(ctx.response()));
     * @endcode
     */
    class ControlFlow {
    public:
        static ControlFlow next() { return ControlFlow{false, std::nullopt}; }
        static ControlFlow reject(HttpResponse response) { return ControlFlow{true, std::move(response)}; }

        bool is_rejected() const noexcept { return rejected_; }

        /// 仅 reject(resp) 时有值
        std::optional<HttpResponse>& response() noexcept { return response_; }

    private:
        ControlFlow(const bool rejected, std::optional<HttpResponse> response)
            : rejected_(rejected), response_(std::move(response)) {}

        bool rejected_;
        std::optional<HttpResponse> response_;
    };

    /**
     * @brief 链式中间件接口。
     *
     * Guard 可以读取、修改 RequestContext (例如把认证后的用户放进 extensions)，
     * 然后决定放行或拒绝。Guard 可以挂起等待外部 I/O，不会阻塞其他请求。
     */
    class Guard {
    public:
        virtual ~Guard() = default;

        virtual boost::asio::awaitable<ControlFlow> invoke(RequestContext& ctx) const = 0;
    };

    using GuardPtr = std::shared_ptr<const Guard>;

    namespace detail {
        template<typename Fn>
        class FunctionGuard final : public Guard {
        public:
            explicit FunctionGuard(Fn fn) : fn_(std::move(fn)) {}

            boost::asio::awaitable<ControlFlow> invoke(RequestContext& ctx) const override {
                return fn_(ctx);
            }

        private:
            Fn fn_;
        };
    } // namespace detail

    /**
     * @brief 把一个签名为 awaitable<ControlFlow>(RequestContext&) 的 lambda 包装成 Guard。
     * @code
     * auto guard = make_guard([](RequestContext& ctx) -> boost::asio::awaitable<ControlFlow> {
     *     co_return ControlFlow::next();
     * });
     * @endcode
     */
    template<typename Fn>
    GuardPtr make_guard(Fn&& fn) {
        static_assert(std::is_invocable_r_v<boost::asio::awaitable<ControlFlow>, const std::decay_t<Fn>&, RequestContext&>,
                      "guard must be callable as awaitable<ControlFlow>(RequestContext&)");
        return std::make_shared<const detail::FunctionGuard<std::decay_t<Fn>>>(std::forward<Fn>(fn));
    }

    /**
     * @brief 路由终点绑定：按顺序执行的 Guard 链 + 最终的处理函数。
     * guards 的顺序就是构建期拼接的顺序 (外层分组 -> 内层分组 -> 路由自身)。
     */
    struct HandlerBinding {
        std::vector<GuardPtr> guards;
        HandlerFunc handler;
    };

} // namespace routix

#endif //ROUTIX_HANDLER_HPP
