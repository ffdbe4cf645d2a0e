//
// Created by Aiziboy on 2025/12/3.
//

#include <routix/http/route_pattern.hpp>
#include <routix/error/routix_error.hpp>
#include <routix/utils/url_codec.hpp>

#include <algorithm>
#include <cctype>

namespace {

    bool is_valid_name(std::string_view name) {
        return !name.empty() && std::ranges::all_of(name, [](const char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        });
    }

    [[noreturn]] void throw_invalid(std::string_view pattern, const std::string& reason) {
        throw routix::ConflictError(routix_error::routing::code::invalid_pattern,
                                    "invalid route pattern '" + std::string(pattern) + "': " + reason);
    }

} // namespace

namespace routix {

    RoutePattern RoutePattern::compile(std::string_view pattern) {
        RoutePattern out;

        const auto parts = url_codec::split_path(pattern);
        out.segments.reserve(parts.size());

        for (size_t i = 0; i < parts.size(); ++i) {
            const std::string_view seg = parts[i].raw;
            SegmentSpec spec;

            if (seg.front() == ':' || seg.front() == '*') {
                spec.kind = seg.front() == ':' ? SegmentKind::dynamic : SegmentKind::wildcard;
                spec.text = std::string(seg.substr(1));

                if (!is_valid_name(spec.text)) {
                    throw_invalid(pattern, "bad parameter name in segment '" + std::string(seg) + "'");
                }
                if (spec.kind == SegmentKind::wildcard && i + 1 != parts.size()) {
                    throw_invalid(pattern, "wildcard '" + std::string(seg) + "' must be the last segment");
                }
                const bool duplicated = std::ranges::any_of(out.segments, [&](const SegmentSpec& prev) {
                    return prev.kind != SegmentKind::literal && prev.text == spec.text;
                });
                if (duplicated) {
                    throw_invalid(pattern, "parameter '" + spec.text + "' bound twice");
                }
            } else {
                // 字面量段按解码后的形式存储，与请求路径解码后的段直接比较
                spec.kind = SegmentKind::literal;
                spec.text = url_codec::url_decode(seg);
            }

            out.segments.push_back(std::move(spec));
        }
        return out;
    }

    std::string RoutePattern::to_string() const {
        if (segments.empty()) return "/";

        std::string out;
        for (const auto& seg : segments) {
            out += '/';
            switch (seg.kind) {
                case SegmentKind::dynamic: out += ':'; break;
                case SegmentKind::wildcard: out += '*'; break;
                case SegmentKind::literal: break;
            }
            out += seg.text;
        }
        return out;
    }

} // namespace routix
