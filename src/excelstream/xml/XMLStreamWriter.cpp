#include "XMLStreamWriter.hpp"
#include "excelstream/utils/XMLUtils.hpp"
#include "excelstream/utils/ModuleLoggers.hpp"
#include "excelstream/core/Exception.hpp"
#include <fmt/format.h>

namespace excelstream {
namespace xml {

XMLStreamWriter::XMLStreamWriter() {
    pending_attributes_.reserve(8);
}

XMLStreamWriter::XMLStreamWriter(WriteCallback callback)
    : output_mode_(OutputMode::CALLBACK)
    , write_callback_(std::move(callback)) {
    if (!write_callback_) {
        throw core::ParameterException("Callback cannot be null", "callback", __FILE__, __LINE__);
    }
    pending_attributes_.reserve(8);
}

XMLStreamWriter::~XMLStreamWriter() {
    if (!element_stack_.empty()) {
        XML_DEBUG("XMLStreamWriter destroyed with {} unclosed elements", element_stack_.size());
    }
}

void XMLStreamWriter::startDocument(bool standalone) {
    buffer_.append("<?xml version=\"1.0\" encoding=\"UTF-8\"");
    if (standalone) {
        buffer_.append(" standalone=\"yes\"");
    }
    buffer_.append("?>\n");
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        XML_WARN("Auto-closing unclosed element: {}", element_stack_.back());
        endElement();
    }
    flush();
}

void XMLStreamWriter::startElement(std::string_view name) {
    if (name.empty()) {
        throw core::ParameterException("Element name cannot be empty", "name", __FILE__, __LINE__);
    }

    ensureElementClosed();

    buffer_.push_back('<');
    buffer_.append(name);

    element_stack_.emplace_back(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        throw core::OperationException("No element to close", "endElement",
                                       core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }

    if (in_element_) {
        // 自闭合元素
        writeAttributesToBuffer();
        buffer_.append("/>");
        in_element_ = false;
    } else {
        buffer_.append("</");
        buffer_.append(element_stack_.back());
        buffer_.push_back('>');
    }
    element_stack_.pop_back();

    maybeFlushChunk();
}

void XMLStreamWriter::writeEmptyElement(std::string_view name) {
    startElement(name);
    endElement();
}

void XMLStreamWriter::checkAttributeAllowed(std::string_view name) const {
    if (!in_element_) {
        throw core::OperationException("Cannot write attribute outside of element", "writeAttribute",
                                       core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
    if (name.empty()) {
        throw core::ParameterException("Attribute name cannot be empty", "name", __FILE__, __LINE__);
    }
}

void XMLStreamWriter::writeAttribute(std::string_view name, std::string_view value) {
    checkAttributeAllowed(name);
    pending_attributes_.emplace_back(name, std::string(value));
}

void XMLStreamWriter::writeAttribute(std::string_view name, const char* value) {
    writeAttribute(name, std::string_view(value ? value : ""));
}

void XMLStreamWriter::writeAttribute(std::string_view name, int value) {
    checkAttributeAllowed(name);
    pending_attributes_.emplace_back(name, fmt::format("{}", value));
}

void XMLStreamWriter::writeAttribute(std::string_view name, double value) {
    checkAttributeAllowed(name);
    // fmt 输出最短往返表示，整数值不带小数点
    pending_attributes_.emplace_back(name, fmt::format("{}", value));
}

void XMLStreamWriter::writeAttribute(std::string_view name, bool value) {
    checkAttributeAllowed(name);
    pending_attributes_.emplace_back(name, value ? std::string("1") : std::string("0"));
}

void XMLStreamWriter::writeText(std::string_view text) {
    ensureElementClosed();
    utils::XMLUtils::appendEscaped(buffer_, text);
    maybeFlushChunk();
}

void XMLStreamWriter::writeRaw(std::string_view data) {
    ensureElementClosed();
    if (output_mode_ == OutputMode::CALLBACK && data.size() >= kCallbackChunkSize) {
        // 大块原始数据直接交给回调，避免再拷贝一份
        flush();
        write_callback_(data.data(), data.size());
        bytes_written_ += data.size();
        return;
    }
    buffer_.append(data);
    maybeFlushChunk();
}

void XMLStreamWriter::flush() {
    if (output_mode_ != OutputMode::CALLBACK || buffer_.empty()) {
        return;
    }
    write_callback_(buffer_.data(), buffer_.size());
    bytes_written_ += buffer_.size();
    buffer_.clear();
}

void XMLStreamWriter::clear() {
    buffer_.clear();
    element_stack_.clear();
    pending_attributes_.clear();
    in_element_ = false;
    bytes_written_ = 0;
}

std::string XMLStreamWriter::take() {
    ensureElementClosed();
    std::string out;
    out.swap(buffer_);
    return out;
}

void XMLStreamWriter::maybeFlushChunk() {
    if (output_mode_ == OutputMode::CALLBACK && buffer_.size() >= kCallbackChunkSize) {
        flush();
    }
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        writeAttributesToBuffer();
        buffer_.push_back('>');
        in_element_ = false;
    }
}

void XMLStreamWriter::writeAttributesToBuffer() {
    for (const auto& attr : pending_attributes_) {
        buffer_.push_back(' ');
        buffer_.append(attr.key);
        buffer_.append("=\"");
        utils::XMLUtils::appendEscaped(buffer_, attr.value, true);
        buffer_.push_back('"');
    }
    pending_attributes_.clear();
}

} // namespace xml
} // namespace excelstream
