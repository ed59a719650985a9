#pragma once

#include "excelstream/core/Constants.hpp"
#include "excelstream/core/Expected.hpp"
#include <string>
#include <utility>
#include <regex>
#include <fmt/format.h>

namespace excelstream {
namespace utils {

/**
 * @brief Excel 地址解析工具类
 *
 * 行列索引均基于0：A1 <-> (0, 0)。
 * 列范围 A..XFD，行范围 1..1048576，超出范围视为无效地址。
 */
class AddressParser {
public:
    /**
     * @brief 解析单元格地址 "A1"（不区分大小写，可带 $ 绝对引用标记）
     * @return (行索引, 列索引)，基于0
     *
     * @example
     * auto pos = AddressParser::tryParseAddress("B2");   // (1, 1)
     * auto bad = AddressParser::tryParseAddress("A0");   // InvalidCellReference
     */
    static core::Result<std::pair<int, int>> tryParseAddress(const std::string& address) {
        static const std::regex addr_regex(R"(^\$?([A-Za-z]{1,3})\$?([0-9]{1,7})$)");
        std::smatch matches;

        if (!std::regex_match(address, matches, addr_regex)) {
            return core::makeError(core::ErrorCode::InvalidCellReference,
                                   fmt::format("invalid cell name \"{}\"", address));
        }

        int col = columnStringToIndex(matches[1].str());
        int row = std::stoi(matches[2].str()) - 1; // 转换为0基索引

        if (col < 0 || col >= core::Constants::kMaxColumns) {
            return core::makeError(core::ErrorCode::InvalidCellReference,
                                   fmt::format("column number exceeds maximum limit in \"{}\"", address));
        }
        if (row < 0 || row >= core::Constants::kMaxRows) {
            return core::makeError(core::ErrorCode::InvalidCellReference,
                                   fmt::format("row number exceeds maximum limit in \"{}\"", address));
        }

        return std::make_pair(row, col);
    }

    /**
     * @brief 将行列索引转换为 Excel 地址
     *
     * @example
     * AddressParser::tryIndexToAddress(0, 0);      // "A1"
     * AddressParser::tryIndexToAddress(1, 2);      // "C2"
     * AddressParser::tryIndexToAddress(0, 16384);  // InvalidCellReference
     */
    static core::Result<std::string> tryIndexToAddress(int row, int col) {
        if (col < 0 || col >= core::Constants::kMaxColumns) {
            return core::makeError(core::ErrorCode::InvalidCellReference,
                                   fmt::format("column number {} is out of range", col + 1));
        }
        if (row < 0 || row >= core::Constants::kMaxRows) {
            return core::makeError(core::ErrorCode::InvalidCellReference,
                                   fmt::format("row number {} is out of range", row + 1));
        }

        std::string addr = indexToColumnString(col);
        addr += std::to_string(row + 1);  // 转换为1基索引
        return addr;
    }

    /**
     * @brief 抛异常版本
     * @throws CellException 地址无效
     */
    static std::pair<int, int> parseAddress(const std::string& address) {
        return tryParseAddress(address).valueOrThrow();
    }

    static std::string indexToAddress(int row, int col) {
        return tryIndexToAddress(row, col).valueOrThrow();
    }

    static bool isValidAddress(const std::string& address) noexcept {
        return tryParseAddress(address).hasValue();
    }

    /**
     * @brief 将列索引转换为列字符串 (0->A, 25->Z, 26->AA, ...)
     */
    static std::string indexToColumnString(int index) {
        std::string result;
        index++; // 转换为1基索引进行计算

        while (index > 0) {
            index--;
            result.insert(result.begin(), static_cast<char>('A' + (index % 26)));
            index /= 26;
        }

        return result;
    }

private:
    /**
     * @brief 将列字符串转换为索引 (A->0, B->1, ..., Z->25, AA->26, ...)
     */
    static int columnStringToIndex(const std::string& col_str) {
        int result = 0;
        for (char c : col_str) {
            char upper = (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
            result = result * 26 + (upper - 'A' + 1);
        }
        return result - 1;
    }
};

}} // namespace excelstream::utils
