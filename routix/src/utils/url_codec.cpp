//
// Created by Aiziboy on 2025/12/3.
//

#include <routix/utils/url_codec.hpp>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/range/iterator_range.hpp>
#include <boost/url/encoding_opts.hpp>
#include <boost/url/parse_query.hpp>
#include <boost/url/params_view.hpp>

namespace url_codec {

    std::string_view strip_query(std::string_view target) {
        if (const auto pos = target.find_first_of("?#"); pos != std::string_view::npos) {
            return target.substr(0, pos);
        }
        return target;
    }

    std::string_view query_string(std::string_view target) {
        const auto pos = target.find('?');
        if (pos == std::string_view::npos) {
            return {};
        }
        std::string_view query = target.substr(pos + 1);
        if (const auto hash = query.find('#'); hash != std::string_view::npos) {
            query = query.substr(0, hash);
        }
        return query;
    }

    std::vector<PathSegment> split_path(std::string_view path) {
        std::vector<boost::iterator_range<std::string_view::const_iterator>> parts;
        boost::split(parts, path, boost::is_any_of("/"), boost::token_compress_on);

        std::vector<PathSegment> segments;
        segments.reserve(parts.size());
        for (const auto& part : parts) {
            if (part.empty()) continue;
            const auto offset = static_cast<std::size_t>(part.begin() - path.begin());
            segments.push_back({path.substr(offset, part.size()), offset});
        }
        return segments;
    }

    void url_decode(std::string_view sv, std::string& buffer, bool plus_as_space) {
        auto hex_value = [](const char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };

        for (size_t i = 0; i < sv.size(); ++i) {
            if (sv[i] == '%' && i + 2 < sv.size()) {
                const int hi = hex_value(sv[i + 1]);
                const int lo = hex_value(sv[i + 2]);
                if (hi >= 0 && lo >= 0) {
                    buffer += static_cast<char>(hi * 16 + lo);
                    i += 2;
                } else {
                    buffer += '%'; // 非法编码，保留原始字符
                }
            } else if (sv[i] == '+' && plus_as_space) {
                buffer += ' ';
            } else {
                buffer += sv[i];
            }
        }
    }

    bool parse_params(std::string_view encoded, routix::QueryParams& out) {
        // 注意：这里如果直接 .value() 会在解析失败时抛出异常
        auto result = boost::urls::parse_query(boost::urls::string_view(encoded.data(), encoded.size()));
        if (!result.has_value()) {
            return false;
        }

        // 查询串与 urlencoded 表单都把 '+' 当作空格
        const boost::urls::params_view params(result.value(), boost::urls::encoding_opts(true));
        for (const auto& param : params) {
            // "a&&b" 中间的空参数
            if (param.key.empty() && !param.has_value) continue;
            out[param.key].push_back(param.has_value ? param.value : std::string{});
        }
        return true;
    }

    bool is_valid_utf8(std::string_view sv) {
        const auto* s = reinterpret_cast<const unsigned char*>(sv.data());
        const size_t n = sv.size();
        size_t i = 0;
        while (i < n) {
            const unsigned char c = s[i];
            if (c < 0x80) {
                ++i;
                continue;
            }

            size_t len = 0;
            unsigned int cp = 0;
            if ((c & 0xE0) == 0xC0) {
                len = 2;
                cp = c & 0x1F;
            } else if ((c & 0xF0) == 0xE0) {
                len = 3;
                cp = c & 0x0F;
            } else if ((c & 0xF8) == 0xF0) {
                len = 4;
                cp = c & 0x07;
            } else {
                return false;
            }

            if (i + len > n) return false;
            for (size_t k = 1; k < len; ++k) {
                if ((s[i + k] & 0xC0) != 0x80) return false;
                cp = (cp << 6) | (s[i + k] & 0x3F);
            }

            // 超长编码、代理区、超出 Unicode 范围
            if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
            if (cp >= 0xD800 && cp <= 0xDFFF) return false;
            if (cp > 0x10FFFF) return false;

            i += len;
        }
        return true;
    }

} // namespace url_codec
