//
// Created by Aiziboy on 2025/12/3.
//

#ifndef ROUTIX_PARAM_PARSER_HPP
#define ROUTIX_PARAM_PARSER_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace param_parser {

    // 不区分大小写的 string_view 比较
    inline bool isEquals(std::string_view a, std::string_view b) {
        return std::equal(a.begin(), a.end(),
                          b.begin(), b.end(),
                          [](char x, char y) {
                              return std::tolower(static_cast<unsigned char>(x)) ==
                                     std::tolower(static_cast<unsigned char>(y));
                          });
    }

    /// 能够从路径/查询参数转换得到的类型
    template<typename T>
    concept Parsable = (std::is_arithmetic_v<T> && !std::is_same_v<T, char>)
                       || std::is_same_v<T, std::string>
                       || std::is_same_v<T, std::string_view>;

    /// 文本类型需要额外做 UTF-8 校验
    template<typename T>
    inline constexpr bool is_text_v = std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>;

    template<Parsable T>
    std::optional<T> tryParse(std::string_view sv) {
        // 对于数字类型（整数和浮点）
        if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) {
            T value{};
            auto result = std::from_chars(sv.data(), sv.data() + sv.size(), value);
            if (result.ec == std::errc() && result.ptr == sv.data() + sv.size()) {
                return value;
            }
        }
        // 对于 bool
        else if constexpr (std::is_same_v<T, bool>) {
            if (isEquals(sv, "true") || sv == "1") return true;
            if (isEquals(sv, "false") || sv == "0") return false;
        }
        // 对于 std::string （创建副本）
        else if constexpr (std::is_same_v<T, std::string>) {
            return std::string{sv};
        }
        // 对于 std::string_view 直接返回
        else if constexpr (std::is_same_v<T, std::string_view>) {
            return sv;
        }

        return std::nullopt;
    }

} // namespace param_parser


#endif //ROUTIX_PARAM_PARSER_HPP
