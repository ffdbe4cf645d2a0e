//
// Created by Aiziboy on 2025/12/10.
//

#ifndef DEMO_USER_HPP
#define DEMO_USER_HPP

#include <cstdint>
#include <string>
#include <boost/json/conversion.hpp>
#include <boost/json/value.hpp>

namespace demo {

    struct User {
        int64_t id = 0;
        std::string name;
        std::string email;
    };

    // 序列化
    inline void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const User& u) {
        jv = {
            {"id", u.id},
            {"name", u.name},
            {"email", u.email},
        };
    }

    // 反序列化：id 来自路径参数，body 里只有 name / email
    inline User tag_invoke(boost::json::value_to_tag<User>, const boost::json::value& jv) {
        const auto& obj = jv.as_object();
        User u;
        u.name = boost::json::value_to<std::string>(obj.at("name"));
        if (const auto* email = obj.if_contains("email")) {
            u.email = boost::json::value_to<std::string>(*email);
        }
        return u;
    }

    /// ApiKeyGuard 认证通过后放进请求扩展槽
    struct Principal {
        std::string api_key;
        std::string name;
    };

} // namespace demo

#endif //DEMO_USER_HPP
