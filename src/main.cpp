#include "excelstream/core/StreamWriter.hpp"
#include "excelstream/utils/Logger.hpp"
#include "excelstream/utils/ModuleLoggers.hpp"
#include <chrono>
#include <iostream>

int main()
{
    excelstream::Logger::getInstance().initialize("logs/excelstream.log",
                                                  excelstream::Logger::Level::DEBUG,
                                                  true);

    using namespace excelstream::core;

    auto workbook = Workbook::create();
    if (!workbook->addSheet("Sheet1")) {
        DEMO_ERROR("Failed to add sheet");
        return 1;
    }

    // 非流式字段在收尾时原样保留
    auto model = workbook->getWorksheetModel("Sheet1");
    if (model) {
        (void)model.value()->freezePanes(1, 0);
        (void)model.value()->setColumnWidth(0, 16);
    }

    auto writer = workbook->newStreamWriter("Sheet1");
    if (!writer) {
        DEMO_ERROR("Failed to open stream writer: {}", writer.error().fullMessage());
        return 1;
    }
    auto& stream = *writer.value();

    auto status = stream.setRow("A1", {"Name", "Score", "Passed", "Recorded"}, {1, 1, 1, 1});
    if (status) {
        status = stream.setRow("A2", {" Alice ", 95.5, true, std::chrono::system_clock::now()});
    }
    if (status) {
        status = stream.setRow("A3", {"Bob", 72, false, nullptr});
    }
    if (!status) {
        DEMO_ERROR("Failed to write row: {}", status.error().fullMessage());
        return 1;
    }

    auto flushed = stream.flush();
    if (!flushed) {
        DEMO_ERROR("Flush failed: {}", flushed.error().fullMessage());
        return 1;
    }

    const std::string* part = workbook->getPart(Workbook::sheetPartPath(1));
    DEMO_INFO("Sheet part {} bytes", part ? part->size() : 0);
    if (part) {
        std::cout << *part << std::endl;
    }

    excelstream::Logger::getInstance().flush();
    return 0;
}
