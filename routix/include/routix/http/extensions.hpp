//
// Created by Aiziboy on 2025/12/5.
//

#ifndef ROUTIX_EXTENSIONS_HPP
#define ROUTIX_EXTENSIONS_HPP

#include <any>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace routix {

    /**
     * @brief 请求级别的扩展槽，按类型存放任意数据。
     *
     * Guard 把解析出的状态 (已认证的用户、会话等) 放进来，
     * 后续的 Guard 和 Handler 按类型取出。每种类型最多一份，重复 insert 覆盖旧值。
     */
    class Extensions {
    public:
        template<typename T>
        T& insert(T value) {
            auto& slot = values_[std::type_index(typeid(T))];
            slot = std::move(value);
            return *std::any_cast<T>(&slot);
        }

        /// 类型不存在时返回 nullptr
        template<typename T>
        T* get() noexcept {
            const auto it = values_.find(std::type_index(typeid(T)));
            return it == values_.end() ? nullptr : std::any_cast<T>(&it->second);
        }

        template<typename T>
        const T* get() const noexcept {
            const auto it = values_.find(std::type_index(typeid(T)));
            return it == values_.end() ? nullptr : std::any_cast<T>(&it->second);
        }

        template<typename T>
        bool contains() const noexcept {
            return values_.contains(std::type_index(typeid(T)));
        }

        template<typename T>
        bool remove() {
            return values_.erase(std::type_index(typeid(T))) > 0;
        }

        std::size_t size() const noexcept { return values_.size(); }

    private:
        std::unordered_map<std::type_index, std::any> values_;
    };

} // namespace routix

#endif //ROUTIX_EXTENSIONS_HPP
