/**
 * @file streaming_large_sheet.cpp
 * @brief 流式写入大量行的示例
 *
 * 行数据超过阈值后迁移到临时文件，内存占用与行数无关。
 * 用法: streaming_large_sheet [行数] [迁移阈值字节数]
 */

#include "excelstream/core/StreamWriter.hpp"
#include "excelstream/utils/Logger.hpp"
#include "excelstream/utils/ModuleLoggers.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace excelstream::core;

int main(int argc, char** argv) {
    excelstream::Logger::getInstance().initialize("logs/streaming_large_sheet.log",
                                                  excelstream::Logger::Level::INFO,
                                                  true);

    const long rows = argc > 1 ? std::strtol(argv[1], nullptr, 10) : 200000;
    WorkbookOptions options;
    if (argc > 2) {
        options.stream.spill_threshold = static_cast<size_t>(std::strtoull(argv[2], nullptr, 10));
    }

    auto workbook = Workbook::create(options);
    if (!workbook->addSheet("Sales")) {
        DEMO_ERROR("Failed to add sheet");
        return 1;
    }

    auto writer = workbook->newStreamWriter("Sales");
    if (!writer) {
        DEMO_ERROR("Failed to open stream writer: {}", writer.error().fullMessage());
        return 1;
    }
    auto& stream = *writer.value();

    std::mt19937 gen(42);
    std::uniform_real_distribution<> amount_dist(10.0, 5000.0);
    const std::vector<std::string> regions = {"North", "East", "South", "West"};

    auto start_time = std::chrono::steady_clock::now();

    auto status = stream.setRow("A1", {"Id", "Region", "Amount", "Shipped"}, {1, 1, 1, 1});
    for (long i = 0; status && i < rows; ++i) {
        status = stream.setRow(static_cast<int>(i) + 1, 0,
                               {i + 1, regions[static_cast<size_t>(i) % regions.size()],
                                amount_dist(gen), i % 3 == 0});
    }
    if (!status) {
        DEMO_ERROR("Failed to write row: {}", status.error().fullMessage());
        return 1;
    }

    DEMO_INFO("Wrote {} rows: {} bytes spilled, {} bytes in memory{}",
              stream.getRowCount(), stream.getSpilledBytes(), stream.getBufferedBytes(),
              stream.isDegraded() ? " (spill storage unavailable)" : "");

    auto flushed = stream.flush();
    if (!flushed) {
        DEMO_ERROR("Flush failed: {}", flushed.error().fullMessage());
        return 1;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    const std::string* part = workbook->getPart(Workbook::sheetPartPath(1));

    std::cout << "Rows:       " << stream.getRowCount() << std::endl;
    std::cout << "Part size:  " << (part ? part->size() : 0) << " bytes" << std::endl;
    std::cout << "Elapsed:    " << elapsed.count() << " ms" << std::endl;

    excelstream::Logger::getInstance().shutdown();
    return 0;
}
