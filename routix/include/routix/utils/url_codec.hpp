//
// Created by Aiziboy on 2025/12/3.
//

#ifndef ROUTIX_URL_CODEC_HPP
#define ROUTIX_URL_CODEC_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <routix/http/http_common_types.hpp>

namespace url_codec {

    /// 路径中的一个非空段，offset 是该段在原始路径中的起始位置
    struct PathSegment {
        std::string_view raw;
        std::size_t offset;
    };

    /**
     * @brief 去掉请求目标中的查询串和片段。
     * "/users/7?x=1#top" -> "/users/7"
     */
    std::string_view strip_query(std::string_view target);

    /**
     * @brief 取出请求目标中 '?' 之后、'#' 之前的查询串，没有则返回空。
     */
    std::string_view query_string(std::string_view target);

    /**
     * @brief 按 '/' 切分路径，忽略所有空段 (开头、结尾和连续的斜杠)。
     */
    std::vector<PathSegment> split_path(std::string_view path);

    /**
     * @brief 百分号解码，结果追加到 buffer。
     * 非法的转义 (如 "%zz"、末尾的 "%4") 原样保留。
     * @param plus_as_space 为 true 时把 '+' 解码为空格 (查询串与表单使用)
     */
    void url_decode(std::string_view sv, std::string& buffer, bool plus_as_space);

    inline std::string url_decode(std::string_view sv, bool plus_as_space = false) {
        std::string out;
        out.reserve(sv.size());
        url_decode(sv, out, plus_as_space);
        return out;
    }

    /**
     * @brief 解析 "a=1&b=2&a=3" 形式的键值串 (查询串和 urlencoded 表单共用)。
     * 同名参数按出现顺序追加，没有 '=' 的参数值为空串，'+' 解码为空格。
     * @return 含有非法百分号编码等无法解析的内容时返回 false，此时 out 不被修改
     */
    [[nodiscard]] bool parse_params(std::string_view encoded, routix::QueryParams& out);

    /// 校验是否为合法的 UTF-8 (拒绝超长编码和代理区码点)
    bool is_valid_utf8(std::string_view sv);

} // namespace url_codec

#endif //ROUTIX_URL_CODEC_HPP
