#include <gtest/gtest.h>
#include <iostream>

#include "fastxls/utils/Logger.hpp"

// 测试主函数
int main(int argc, char** argv) {
    std::cout << "FastXLS 单元测试开始..." << std::endl;

    // 只输出警告及以上，避免解析日志淹没测试输出
    fastxls::Logger::getInstance().initialize("", fastxls::Logger::Level::WARN, true);

    // 初始化 GoogleTest
    ::testing::InitGoogleTest(&argc, argv);

    // 运行所有测试
    int result = RUN_ALL_TESTS();

    if (result == 0) {
        std::cout << "所有测试通过！" << std::endl;
    } else {
        std::cout << "有测试失败！" << std::endl;
    }

    fastxls::Logger::getInstance().flush();
    return result;
}
