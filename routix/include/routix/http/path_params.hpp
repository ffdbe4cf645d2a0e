//
// Created by Aiziboy on 2025/12/3.
//

#ifndef ROUTIX_PATH_PARAMS_HPP
#define ROUTIX_PATH_PARAMS_HPP

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace routix {

    /**
     * @brief 路由匹配时捕获的路径参数。
     *
     * 插入顺序即路径中出现的顺序，元组提取 (ctx.path<std::tuple<...>>()) 依赖这个顺序。
     * 一个路由的参数个数通常只有 1~3 个，线性查找比哈希表更快。
     */
    class PathParams {
    public:
        using value_type = std::pair<std::string, std::string>;
        using const_iterator = std::vector<value_type>::const_iterator;

        PathParams() = default;
        PathParams(std::initializer_list<value_type> init) : params_(init) {}

        void emplace_back(std::string name, std::string value) {
            params_.emplace_back(std::move(name), std::move(value));
        }

        void pop_back() { params_.pop_back(); }

        std::optional<std::string_view> find(std::string_view name) const {
            for (const auto& [key, value] : params_) {
                if (key == name) return std::string_view{value};
            }
            return std::nullopt;
        }

        /// 按位置访问，index 必须小于 size()
        const value_type& at(std::size_t index) const { return params_.at(index); }

        std::size_t size() const noexcept { return params_.size(); }
        bool empty() const noexcept { return params_.empty(); }

        const_iterator begin() const noexcept { return params_.begin(); }
        const_iterator end() const noexcept { return params_.end(); }

        bool operator==(const PathParams&) const = default;

    private:
        std::vector<value_type> params_;
    };

} // namespace routix

#endif //ROUTIX_PATH_PARAMS_HPP
