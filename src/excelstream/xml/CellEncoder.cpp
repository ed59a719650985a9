#include "CellEncoder.hpp"
#include "XMLStreamWriter.hpp"
#include "excelstream/core/Constants.hpp"
#include "excelstream/utils/TimeUtils.hpp"
#include "excelstream/utils/XMLUtils.hpp"
#include <utf8.h>
#include <fmt/format.h>
#include <iterator>
#include <variant>

namespace excelstream {
namespace xml {

namespace {

EncodedCell numeric(std::string text) {
    EncodedCell cell;
    cell.value = std::move(text);
    return cell;
}

// fmt 的最短表示在极大或极小值时使用指数形式，展开为普通小数：
// "1e+16" -> "10000000000000000"，"1.5e-05" -> "0.000015"
std::string expandExponent(std::string text) {
    const size_t exp_pos = text.find('e');
    if (exp_pos == std::string::npos) {
        return text;
    }

    const int exponent = std::stoi(text.substr(exp_pos + 1));
    std::string mantissa = text.substr(0, exp_pos);
    const bool negative = !mantissa.empty() && mantissa.front() == '-';
    if (negative) {
        mantissa.erase(0, 1);
    }

    const size_t dot = mantissa.find('.');
    const int int_digits = static_cast<int>(dot == std::string::npos ? mantissa.size() : dot);
    std::string digits = mantissa;
    if (dot != std::string::npos) {
        digits.erase(dot, 1);
    }

    const int point = int_digits + exponent;
    std::string out;
    if (point <= 0) {
        out = "0." + std::string(static_cast<size_t>(-point), '0') + digits;
    } else if (static_cast<size_t>(point) >= digits.size()) {
        out = digits + std::string(static_cast<size_t>(point) - digits.size(), '0');
    } else {
        out = digits.substr(0, static_cast<size_t>(point)) + "." + digits.substr(static_cast<size_t>(point));
    }
    return negative ? "-" + out : out;
}

template<typename Float>
EncodedCell floating(Float value) {
    return numeric(expandExponent(fmt::format("{}", value)));
}

} // anonymous namespace

std::string CellEncoder::truncateText(std::string_view text, size_t max_chars) {
    if (text.size() <= max_chars) {
        // 字节数不超过上限时字符数必然也不超过
        return std::string(text);
    }

    if (utf8::is_valid(text.begin(), text.end())) {
        auto it = text.begin();
        size_t count = 0;
        while (it != text.end() && count < max_chars) {
            utf8::unchecked::next(it);
            ++count;
        }
        return std::string(text.begin(), it);
    }

    // 非法 UTF-8：按字节截断，但回退到最近的序列起始字节
    size_t cut = max_chars;
    size_t backed = 0;
    while (cut > 0 && backed < 3 &&
           (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
        ++backed;
    }
    if (backed == 3 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        cut = max_chars;
    }
    return std::string(text.substr(0, cut));
}

EncodedCell CellEncoder::encodeText(std::string_view text) {
    EncodedCell cell;
    cell.type = "str";
    cell.value = truncateText(text, core::Constants::kMaxCellTextLength);

    // 非法 UTF-8 序列替换为 U+FFFD，非法控制字符直接删除，保证输出是合法 XML
    if (!utf8::is_valid(cell.value.begin(), cell.value.end())) {
        std::string replaced;
        replaced.reserve(cell.value.size() + 8);
        utf8::replace_invalid(cell.value.begin(), cell.value.end(), std::back_inserter(replaced));
        cell.value.swap(replaced);
    }
    utils::XMLUtils::stripForbiddenControls(cell.value);

    // 空格检测必须在清理之后，否则 "\x01 a" 会丢失前导空格的 preserve
    if (!cell.value.empty() && (cell.value.front() == ' ' || cell.value.back() == ' ')) {
        cell.preserve_space = true;
    }
    return cell;
}

core::Result<EncodedCell> CellEncoder::encodeValue(const core::CellValue& value) {
    using core::CellValue;
    const auto& storage = value.storage();

    switch (value.type()) {
        case core::CellValueType::Null:
            return encodeText({});
        case core::CellValueType::Integer:
            return numeric(fmt::format("{}", std::get<int64_t>(storage)));
        case core::CellValueType::Unsigned:
            return numeric(fmt::format("{}", std::get<uint64_t>(storage)));
        case core::CellValueType::Float32:
            // float 按单精度求最短往返表示：0.1f -> "0.1"
            return floating(std::get<float>(storage));
        case core::CellValueType::Float64:
            return floating(std::get<double>(storage));
        case core::CellValueType::String:
            return encodeText(std::get<std::string>(storage));
        case core::CellValueType::Bytes:
            return encodeText(std::get<CellValue::Bytes>(storage).data);
        case core::CellValueType::Duration:
            return floating(utils::TimeUtils::durationToExcelDays(std::get<CellValue::Duration>(storage)));
        case core::CellValueType::Timestamp: {
            auto serial = utils::TimeUtils::toExcelSerialNumber(std::get<CellValue::Timestamp>(storage));
            if (!serial) {
                return serial.error();
            }
            return floating(serial.value());
        }
        case core::CellValueType::Boolean: {
            EncodedCell cell;
            cell.type = "b";
            cell.value = std::get<bool>(storage) ? "1" : "0";
            return cell;
        }
    }

    return core::makeError(core::ErrorCode::InternalError,
                           fmt::format("unhandled cell value type {}",
                                       static_cast<int>(value.type())));
}

core::VoidResult CellEncoder::writeCell(XMLStreamWriter& writer, std::string_view coordinate,
                                        int style, const core::CellValue& value) {
    auto encoded = encodeValue(value);
    if (!encoded) {
        return core::makeError(encoded.error().code, encoded.error().message,
                               fmt::format("cell {}", coordinate));
    }
    const EncodedCell& cell = encoded.value();

    writer.startElement("c");
    writer.writeAttribute("r", coordinate);
    if (style != 0) {
        writer.writeAttribute("s", style);
    }
    if (!cell.type.empty()) {
        writer.writeAttribute("t", cell.type);
    }
    if (cell.preserve_space) {
        writer.writeAttribute("xml:space", "preserve");
    }
    if (!cell.value.empty()) {
        writer.startElement("v");
        writer.writeText(cell.value);
        writer.endElement();
    }
    writer.endElement();
    return {};
}

core::Result<std::string> CellEncoder::encodeCell(std::string_view coordinate, int style,
                                                  const core::CellValue& value) {
    XMLStreamWriter writer;
    auto result = writeCell(writer, coordinate, style, value);
    if (!result) {
        return std::move(result).error();
    }
    return writer.take();
}

}} // namespace excelstream::xml
