#include <gtest/gtest.h>
#include "excelstream/utils/Logger.hpp"
#include <iostream>

// 测试主函数
int main(int argc, char** argv) {
    std::cout << "ExcelStream 单元测试开始..." << std::endl;

    // 测试期间只把警告及以上写入日志文件，不输出到控制台
    excelstream::Logger::getInstance().initialize("logs/excelstream_tests.log",
                                                  excelstream::Logger::Level::WARN,
                                                  false);

    // 初始化 GoogleTest
    ::testing::InitGoogleTest(&argc, argv);

    // 运行所有测试
    int result = RUN_ALL_TESTS();

    if (result == 0) {
        std::cout << "所有测试通过！" << std::endl;
    } else {
        std::cout << "有测试失败！" << std::endl;
    }

    excelstream::Logger::getInstance().shutdown();
    return result;
}
