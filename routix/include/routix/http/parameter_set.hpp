//
// Created by Aiziboy on 2025/12/5.
//

#ifndef ROUTIX_PARAMETER_SET_HPP
#define ROUTIX_PARAMETER_SET_HPP
#include <optional>
#include <string>
#include <string_view>

#include <routix/error/routix_error.hpp>
#include <routix/http/http_common_types.hpp>
#include <routix/utils/param_parser.hpp>
#include <routix/utils/url_codec.hpp>

namespace routix {

    /**
     * @brief 对一个 key -> 多值 的参数表提供带类型转换的只读视图。
     *
     * 查询串和 urlencoded 表单都以这种形式存在于 RequestContext 中。
     * 视图不拥有数据，生命周期不能超过所引用的 map。
     */
    template<typename MapType>
    class ParameterSet {
    public:

        explicit ParameterSet(const MapType& params) : params_(params) {}

        // 获取 string_view (零拷贝)，同名参数取第一个
        std::optional<std::string_view> get_sv(std::string_view key) const {
            auto it = params_.find(key);
            if (it != params_.end() && !it->second.empty()) {
                return std::string_view{it->second.front()};
            }
            return std::nullopt;
        }

        bool contains(std::string_view key) const {
            return params_.find(key) != params_.end();
        }

        // --- get<T>：参数缺失或无法转换时抛出 ExtractError (400) ---
        template<param_parser::Parsable T>
        T get(std::string_view key) const {
            auto sv_opt = get_sv(key);
            if (!sv_opt) {
                throw ExtractError(routix_error::extract::code::missing_parameter, http::status::bad_request,
                                   "Missing required parameter: " + std::string(key));
            }

            if constexpr (param_parser::is_text_v<T>) {
                if (!url_codec::is_valid_utf8(*sv_opt)) {
                    throw ExtractError(routix_error::extract::code::invalid_utf8, http::status::bad_request,
                                       "Parameter '" + std::string(key) + "' is not valid UTF-8");
                }
            }

            auto value = param_parser::tryParse<T>(*sv_opt);
            if (!value) {
                throw ExtractError(routix_error::extract::code::invalid_parameter, http::status::bad_request,
                                   "Parameter '" + std::string(key) + "' with value '" + std::string(*sv_opt) + "' is not valid");
            }
            return *std::move(value);
        }

        // --- 方便的 get_optional<T> ---
        template<param_parser::Parsable T>
        std::optional<T> get_optional(std::string_view key) const {
            try {
                return get<T>(key);
            } catch (const ExtractError&) {
                return std::nullopt;
            }
        }

        // --- 方便的 get_or_default<T> ---
        template<param_parser::Parsable T>
        T get_or_default(std::string_view key, T default_value) const {
            auto opt = get_optional<T>(key);
            return opt ? *std::move(opt) : std::move(default_value);
        }

    private:
        const MapType& params_;
    };

} // namespace routix
#endif //ROUTIX_PARAMETER_SET_HPP
