//
// Created by Aiziboy on 2025/12/5.
//

#include <routix/http/request_context.hpp>
#include <routix/version.hpp>

#include <spdlog/spdlog.h>

namespace {
    constexpr std::string_view form_content_type = "application/x-www-form-urlencoded";
}

namespace routix {

    // --- 构造函数实现 ---

    RequestContext::RequestContext(HttpRequest req, PathParams params, std::string ip)
        : request_(std::move(req)),
          path_params_(std::move(params)),
          ip_(std::move(ip)) {
        // 在构造时为 response 对象设置一些通用的默认值
        response_.version(request_.version());
        response_.keep_alive(request_.keep_alive());
        response_.set(http::field::server, framework::server_header);
    }

    // --- 请求数据访问实现 ---

    const HttpRequest& RequestContext::request() const {
        return request_;
    }

    http::verb RequestContext::method() const {
        return request_.method();
    }

    std::string_view RequestContext::request_path() const {
        return url_codec::strip_query(request_.target());
    }

    const std::string& RequestContext::ip() const {
        return ip_;
    }

    std::optional<std::string_view> RequestContext::pathParam(const std::string_view key) const {
        return path_params_.find(key);
    }

    const PathParams& RequestContext::pathParams() const {
        return path_params_;
    }

    std::optional<std::string_view> RequestContext::queryParam(const std::string_view key) const {
        parseQueryIfNeeded(); // 确保已解析
        const auto it = queryParams_.find(key);
        if (it != queryParams_.end() && !it->second.empty()) {
            return std::string_view{it->second.front()}; // 返回第一个值
        }
        return std::nullopt;
    }

    std::vector<std::string_view> RequestContext::queryParamList(const std::string_view key) const {
        parseQueryIfNeeded();

        std::vector<std::string_view> out;
        if (const auto it = queryParams_.find(key); it != queryParams_.end()) {
            out.assign(it->second.begin(), it->second.end());
        }
        return out;
    }

    const QueryParams& RequestContext::queryParamAll() const {
        parseQueryIfNeeded();
        return queryParams_;
    }

    ParameterSet<QueryParams> RequestContext::queries() const {
        parseQueryIfNeeded();
        return ParameterSet<QueryParams>(queryParams_);
    }

    std::optional<std::string_view> RequestContext::header(const std::string_view name) const {
        const auto it = request_.find(name);
        if (it == request_.end()) {
            return std::nullopt;
        }
        return it->value();
    }

    std::string_view RequestContext::body() const {
        return request_.body();
    }

    std::string RequestContext::take_body() {
        return std::exchange(request_.body(), std::string{});
    }

    ParameterSet<QueryParams> RequestContext::form() const {
        if (!formParsed_) {
            const std::string_view content_type = request_[http::field::content_type];
            // 允许带 "; charset=UTF-8" 之类的参数
            const std::string_view mime = content_type.substr(0, content_type.find(';'));
            if (!param_parser::isEquals(mime, form_content_type)) {
                throw ExtractError(routix_error::extract::code::malformed_body, http::status::bad_request,
                                   "Expected Content-Type " + std::string(form_content_type) +
                                   " but got '" + std::string(content_type) + "'");
            }
            if (!url_codec::parse_params(request_.body(), formParams_)) {
                throw ExtractError(routix_error::extract::code::malformed_body, http::status::bad_request,
                                   "Malformed form body");
            }
            formParsed_ = true;
        }
        return ParameterSet<QueryParams>(formParams_);
    }

    Extensions& RequestContext::extensions() {
        return extensions_;
    }

    const Extensions& RequestContext::extensions() const {
        return extensions_;
    }

    // --- 响应构建实现 ---

    HttpResponse& RequestContext::response() {
        return response_;
    }

    void RequestContext::string(const http::status status, const std::string_view body, const std::string_view content_type) {
        response_.result(status);
        response_.set(http::field::content_type, content_type);
        response_.body() = body;
    }

    void RequestContext::string(const http::status status, const std::string_view body) {
        string(status, body, "text/plain;charset=UTF-8");
    }

    void RequestContext::string(const std::string_view body) {
        string(http::status::ok, body);
    }

    void RequestContext::json(const http::status status, const std::string_view json) {
        string(status, json, "application/json;charset=UTF-8");
    }

    void RequestContext::json(const std::string_view json) {
        this->json(http::status::ok, json);
    }

    // --- 私有辅助函数实现 ---

    void RequestContext::parseQueryIfNeeded() const {
        if (queryParamsParsed_) return;

        // 标记为已解析，即使没有查询参数也只执行一次
        queryParamsParsed_ = true;

        const std::string_view query_str = url_codec::query_string(request_.target());
        if (query_str.empty()) {
            return;
        }
        if (!url_codec::parse_params(query_str, queryParams_)) {
            // 非法查询串按没有查询参数处理
            SPDLOG_WARN("Query parse failed: {}", query_str);
            return;
        }
        SPDLOG_TRACE("解析查询参数 {} 个: {}", queryParams_.size(), query_str);
    }

} // namespace routix
