#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <sstream>
#include <type_traits>
#include <utility>
#include <fmt/format.h>

namespace excelstream {
namespace core {

enum class CellValueType : uint8_t {
    Null = 0,
    Integer = 1,     // 有符号整数
    Unsigned = 2,    // 无符号整数
    Float32 = 3,
    Float64 = 4,
    String = 5,
    Bytes = 6,
    Duration = 7,
    Timestamp = 8,
    Boolean = 9
};

namespace detail {

template<typename T>
struct is_chrono_duration : std::false_type {};

template<typename Rep, typename Period>
struct is_chrono_duration<std::chrono::duration<Rep, Period>> : std::true_type {};

template<typename T>
struct is_system_time_point : std::false_type {};

template<typename Duration>
struct is_system_time_point<std::chrono::time_point<std::chrono::system_clock, Duration>> : std::true_type {};

template<typename T>
struct is_byte_vector : std::false_type {};

template<>
struct is_byte_vector<std::vector<uint8_t>> : std::true_type {};

template<>
struct is_byte_vector<std::vector<char>> : std::true_type {};

template<>
struct is_byte_vector<std::vector<std::byte>> : std::true_type {};

template<typename T, typename = void>
struct is_ostreamable : std::false_type {};

template<typename T>
struct is_ostreamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

template<typename T>
inline constexpr bool dependent_false = false;

} // namespace detail

/**
 * @brief 流式写入的单元格值
 *
 * 从任意 C++ 值隐式构造，构造时即确定编码分支：
 * - 整数（任意宽度，有/无符号）      -> Integer / Unsigned
 * - float / double / long double      -> Float32 / Float64
 * - 字符串、字符串视图、C 字符串、char -> String（空 C 字符串指针 -> Null）
 * - 字节序列 vector<uint8_t|char|byte> -> Bytes
 * - std::chrono::duration              -> Duration
 * - system_clock::time_point           -> Timestamp
 * - bool                               -> Boolean
 * - nullptr / std::monostate / 默认构造 -> Null
 * - 其余可被 fmt 或 operator<< 输出的类型按其文本表示作为 String
 */
class CellValue {
public:
    // 存储精度取微秒，覆盖 1900-9999 年全部日期
    using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;
    using Duration = std::chrono::duration<double>;

    struct Bytes {
        std::string data;
    };

    using Storage = std::variant<std::monostate, int64_t, uint64_t, float, double,
                                 std::string, Bytes, Duration, Timestamp, bool>;

    CellValue() = default;

    template<typename T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, CellValue>>>
    CellValue(T&& value) : storage_(convert(std::forward<T>(value))) {}

    CellValueType type() const noexcept {
        return static_cast<CellValueType>(storage_.index());
    }

    bool isNull() const noexcept { return std::holds_alternative<std::monostate>(storage_); }

    const Storage& storage() const noexcept { return storage_; }

    template<typename T>
    const T& get() const { return std::get<T>(storage_); }

    static const char* typeName(CellValueType type) noexcept;

private:
    template<typename T>
    static Storage convert(T&& value) {
        using U = std::remove_cv_t<std::remove_reference_t<T>>;

        if constexpr (std::is_same_v<U, bool>) {
            return Storage(std::in_place_type<bool>, value);
        } else if constexpr (std::is_same_v<U, std::nullptr_t> || std::is_same_v<U, std::monostate>) {
            return Storage(std::in_place_type<std::monostate>);
        } else if constexpr (std::is_same_v<U, char>) {
            return Storage(std::in_place_type<std::string>, 1, value);
        } else if constexpr (std::is_integral_v<U> && std::is_signed_v<U>) {
            return Storage(std::in_place_type<int64_t>, static_cast<int64_t>(value));
        } else if constexpr (std::is_integral_v<U>) {
            return Storage(std::in_place_type<uint64_t>, static_cast<uint64_t>(value));
        } else if constexpr (std::is_same_v<U, float>) {
            return Storage(std::in_place_type<float>, value);
        } else if constexpr (std::is_floating_point_v<U>) {
            return Storage(std::in_place_type<double>, static_cast<double>(value));
        } else if constexpr (std::is_pointer_v<U> && std::is_convertible_v<U, std::string_view>) {
            // 空 C 字符串按空值处理
            if (value == nullptr) {
                return Storage(std::in_place_type<std::monostate>);
            }
            return Storage(std::in_place_type<std::string>, std::string(value));
        } else if constexpr (std::is_convertible_v<const U&, std::string_view>) {
            return Storage(std::in_place_type<std::string>, std::string(std::string_view(value)));
        } else if constexpr (std::is_same_v<U, Bytes>) {
            return Storage(std::in_place_type<Bytes>, std::forward<T>(value));
        } else if constexpr (detail::is_byte_vector<U>::value) {
            Bytes bytes;
            bytes.data.assign(reinterpret_cast<const char*>(value.data()), value.size());
            return Storage(std::in_place_type<Bytes>, std::move(bytes));
        } else if constexpr (detail::is_chrono_duration<U>::value) {
            return Storage(std::in_place_type<Duration>, std::chrono::duration_cast<Duration>(value));
        } else if constexpr (detail::is_system_time_point<U>::value) {
            return Storage(std::in_place_type<Timestamp>,
                           std::chrono::time_point_cast<std::chrono::microseconds>(value));
        } else if constexpr (fmt::is_formattable<U>::value) {
            return Storage(std::in_place_type<std::string>, fmt::format("{}", value));
        } else if constexpr (detail::is_ostreamable<U>::value) {
            std::ostringstream oss;
            oss << value;
            return Storage(std::in_place_type<std::string>, oss.str());
        } else {
            static_assert(detail::dependent_false<U>,
                          "CellValue: type has no textual representation (provide fmt::formatter or operator<<)");
        }
    }

    Storage storage_;
};

}} // namespace excelstream::core
