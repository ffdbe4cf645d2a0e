//
// Created by Aiziboy on 2025/12/2.
//

#ifndef ROUTIX_VERSION_HPP
#define ROUTIX_VERSION_HPP

#include <string>

namespace routix::framework {
    inline const std::string name = "Routix";
    // 与 CMake 中 project(VERSION) 保持一致
    inline const std::string version = "1.0.0";

    /// 响应头 Server 字段的值
    inline const std::string server_header = name + "/" + version;
}
#endif //ROUTIX_VERSION_HPP
