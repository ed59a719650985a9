/**
 * @file XMLStreamWriter.hpp
 * @brief 轻量XML流写入器
 *
 * 单元格片段、行片段和工作表各字段都通过它生成，保证转义与标签闭合规则一致。
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <utility>


namespace excelstream {
namespace xml {

/**
 * @brief XML流写入器
 *
 * 两种输出模式：
 * - MEMORY_BUFFER：全部内容累积在内存中，toString()/take() 取出
 * - CALLBACK：缓冲区超过块大小后交给回调，适合直接写出大文档
 */
class XMLStreamWriter {
public:
    using WriteCallback = std::function<void(const char* data, size_t length)>;

    enum class OutputMode {
        CALLBACK,       // 回调函数输出
        MEMORY_BUFFER   // 内存缓冲输出
    };

    /**
     * @brief 内存缓冲模式
     */
    XMLStreamWriter();

    /**
     * @brief 回调输出模式
     * @throws ParameterException 回调为空
     */
    explicit XMLStreamWriter(WriteCallback callback);

    ~XMLStreamWriter();

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    XMLStreamWriter(XMLStreamWriter&& other) noexcept = default;
    XMLStreamWriter& operator=(XMLStreamWriter&& other) noexcept = default;

    /**
     * @brief 文档操作
     * @param standalone 是否输出 standalone="yes"
     */
    void startDocument(bool standalone = true);
    void endDocument();

    /**
     * @brief 元素操作
     */
    void startElement(std::string_view name);
    void endElement();
    void writeEmptyElement(std::string_view name);

    /**
     * @brief 属性操作（必须位于 startElement 之后、任何子内容之前）
     */
    void writeAttribute(std::string_view name, std::string_view value);
    void writeAttribute(std::string_view name, const char* value);
    void writeAttribute(std::string_view name, int value);
    void writeAttribute(std::string_view name, double value);
    void writeAttribute(std::string_view name, bool value);

    /**
     * @brief 文本内容操作
     */
    void writeText(std::string_view text);
    void writeRaw(std::string_view data);

    /**
     * @brief 缓冲区管理
     */
    void flush();
    void clear();

    /**
     * @brief 获取输出结果（仅内存模式）
     */
    const std::string& toString() const { return buffer_; }
    std::string take();

    OutputMode getOutputMode() const { return output_mode_; }
    size_t getBytesWritten() const { return bytes_written_ + buffer_.size(); }
    size_t depth() const { return element_stack_.size(); }
    bool isEmpty() const { return buffer_.empty() && bytes_written_ == 0; }

private:
    static constexpr size_t kCallbackChunkSize = 64 * 1024;

    void ensureElementClosed();
    void writeAttributesToBuffer();
    void checkAttributeAllowed(std::string_view name) const;
    void maybeFlushChunk();

    struct XMLAttribute {
        std::string key;
        std::string value;

        XMLAttribute(std::string_view k, std::string v)
            : key(k), value(std::move(v)) {}
    };

    OutputMode output_mode_ = OutputMode::MEMORY_BUFFER;
    WriteCallback write_callback_;

    std::string buffer_;
    std::vector<std::string> element_stack_;
    std::vector<XMLAttribute> pending_attributes_;
    bool in_element_ = false;

    size_t bytes_written_ = 0;
};

}} // namespace excelstream::xml
