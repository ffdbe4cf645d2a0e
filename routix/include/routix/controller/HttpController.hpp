//
// Created by Aiziboy on 2025/12/9.
//

#ifndef ROUTIX_HTTP_CONTROLLER_HPP
#define ROUTIX_HTTP_CONTROLLER_HPP

#include <routix/http/route_compiler.hpp>

namespace routix {

    /// 一组相关路由的提供者，由 App::addController 收集
    class HttpController {
    public:
        virtual RouteDef routes() = 0;
        virtual ~HttpController() = default;
    };

} // namespace routix

#endif // ROUTIX_HTTP_CONTROLLER_HPP
