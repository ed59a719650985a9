#pragma once

#include "excelstream/xml/XMLEscapes.hpp"
#include <algorithm>
#include <string>
#include <string_view>

namespace excelstream {
namespace utils {

/**
 * @brief XML工具类 - 提供XML转义相关的辅助函数
 */
class XMLUtils {
public:
  /**
   * @brief 追加转义后的文本
   * @param out 输出缓冲
   * @param text 需要转义的文本
   * @param attribute 为 true 时按属性值规则转义（换行、回车、制表符转为字符引用）
   *
   * 转义规则：
   * - < -> &lt;   > -> &gt;   & -> &amp;   " -> &quot;   ' -> &apos;
   * - 跳过 XML 1.0 不允许的控制字符（保留制表符、换行符、回车符）
   */
  static void appendEscaped(std::string &out, std::string_view text, bool attribute = false) {
    for (char c : text) {
      switch (c) {
      case '<':
        out.append(xml::XMLEscapes::LT, xml::XMLEscapes::LT_LEN);
        break;
      case '>':
        out.append(xml::XMLEscapes::GT, xml::XMLEscapes::GT_LEN);
        break;
      case '&':
        out.append(xml::XMLEscapes::AMP, xml::XMLEscapes::AMP_LEN);
        break;
      case '"':
        out.append(xml::XMLEscapes::QUOT, xml::XMLEscapes::QUOT_LEN);
        break;
      case '\'':
        out.append(xml::XMLEscapes::APOS, xml::XMLEscapes::APOS_LEN);
        break;
      case '\n':
        if (attribute) out.append(xml::XMLEscapes::NL, xml::XMLEscapes::NL_LEN);
        else out.push_back(c);
        break;
      case '\r':
        // 文本中的裸 \r 会被解析器规范化掉，统一用字符引用保留
        out.append(xml::XMLEscapes::CR, xml::XMLEscapes::CR_LEN);
        break;
      case '\t':
        if (attribute) out.append(xml::XMLEscapes::TAB, xml::XMLEscapes::TAB_LEN);
        else out.push_back(c);
        break;
      default:
        // UTF-8 多字节序列原样保留
        if (isForbiddenControl(c)) {
          continue;
        }
        out.push_back(c);
        break;
      }
    }
  }

  /**
   * @brief XML 1.0 不允许的控制字符（制表符、换行符、回车符除外）
   */
  static bool isForbiddenControl(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return uc < 0x20 && c != '\t' && c != '\n' && c != '\r';
  }

  /**
   * @brief 就地删除 XML 1.0 不允许的控制字符
   */
  static void stripForbiddenControls(std::string &text) {
    text.erase(std::remove_if(text.begin(), text.end(), isForbiddenControl), text.end());
  }

  static std::string escapeXML(std::string_view text) {
    std::string result;
    result.reserve(text.size() + text.size() / 8);
    appendEscaped(result, text);
    return result;
  }
};

}} // namespace excelstream::utils
