#pragma once

#include "excelstream/core/CellValue.hpp"
#include "excelstream/core/Expected.hpp"
#include <string>
#include <string_view>

namespace excelstream {
namespace xml {

class XMLStreamWriter;

/**
 * @brief 单元格编码结果（仅在编码与序列化之间短暂存在）
 */
struct EncodedCell {
    std::string type;            // "" 数值, "str" 字符串, "b" 布尔
    std::string value;           // <v> 中的原始文本（未转义）
    bool preserve_space = false; // 首尾有空格时输出 xml:space="preserve"
};

/**
 * @brief 单元格值编码器
 *
 * 无状态：把 (坐标, 样式索引, 值) 转换为 <c> 片段。
 * 除时间点超出 Excel 日期范围外，任何值都能编码成功。
 */
class CellEncoder {
public:
    /**
     * @brief 只做值到 (类型, 文本) 的转换
     * @return 时间点越界时返回 TimeOutOfRange
     */
    static core::Result<EncodedCell> encodeValue(const core::CellValue& value);

    /**
     * @brief 文本单元格：截断到 32767 个字符并检测首尾空格
     */
    static EncodedCell encodeText(std::string_view text);

    /**
     * @brief 把一个单元格写入已有的 XML 写入器
     *
     * 值先完整编码，编码失败时不会向 writer 写入任何内容。
     */
    static core::VoidResult writeCell(XMLStreamWriter& writer, std::string_view coordinate,
                                      int style, const core::CellValue& value);

    /**
     * @brief 生成单个单元格片段，例如
     *        <c r="A1" s="2" t="str" xml:space="preserve"><v> hi </v></c>
     */
    static core::Result<std::string> encodeCell(std::string_view coordinate, int style,
                                                const core::CellValue& value);

    /**
     * @brief 按 UTF-8 字符截断，不拆分多字节序列；非法 UTF-8 按字节截断
     */
    static std::string truncateText(std::string_view text, size_t max_chars);
};

}} // namespace excelstream::xml
