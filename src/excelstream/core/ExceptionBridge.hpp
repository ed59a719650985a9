/**
 * @file ExceptionBridge.hpp
 * @brief 异常转换层：连接底层Result/Expected和用户层Exception
 */

#pragma once

#include "Expected.hpp"
#include "ErrorCode.hpp"
#include "Exception.hpp"
#include <new>
#include <type_traits>

namespace excelstream {
namespace core {

/**
 * @brief 异常转换层
 *
 * - 热路径使用 Result/Expected，不抛异常
 * - 需要异常的调用方用 unwrap() 转换
 * - 内部调用可能抛异常的组件（XMLStreamWriter 的误用检查等）时用 wrapCall() 收回到 Result
 */
class ExceptionBridge {
public:
    /**
     * @brief 将Result转换为异常抛出
     * @throws ExcelStreamException 及其子类
     */
    template<typename T>
    static T unwrap(Result<T>&& result) {
        if (result.hasError()) {
            throwError(result.error());
        }
        return std::move(result).value();
    }

    static void unwrap(VoidResult&& result) {
        if (result.hasError()) {
            throwError(result.error());
        }
    }

    static void unwrap(const VoidResult& result) {
        if (result.hasError()) {
            throwError(result.error());
        }
    }

    /**
     * @brief 捕获异常并转换为Result
     * @param func 可能抛出异常的函数，返回 void 时结果为 VoidResult
     */
    template<typename F>
    static auto wrapCall(F&& func) -> Result<std::decay_t<decltype(func())>> {
        using ReturnType = decltype(func());
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                func();
                return {};
            } else {
                return func();
            }
        } catch (const ExcelStreamException& e) {
            return makeError(e.getErrorCode(), e.what());
        } catch (const std::bad_alloc&) {
            return makeError(ErrorCode::OutOfMemory, "Memory allocation failed");
        } catch (const std::exception& e) {
            return makeError(ErrorCode::InternalError, e.what());
        }
    }

    /**
     * @brief 捕获异常并转换为VoidResult；func 可返回 void 或 VoidResult
     */
    template<typename F>
    static VoidResult wrapVoidCall(F&& func) {
        using ReturnType = decltype(func());
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                func();
                return {};
            } else {
                return func();
            }
        } catch (const ExcelStreamException& e) {
            return makeError(e.getErrorCode(), e.what());
        } catch (const std::bad_alloc&) {
            return makeError(ErrorCode::OutOfMemory, "Memory allocation failed");
        } catch (const std::exception& e) {
            return makeError(ErrorCode::InternalError, e.what());
        }
    }
};

}} // namespace excelstream::core

// 在用户层API中使用，自动转换Result为异常
#define EXCELSTREAM_UNWRAP(result) \
    excelstream::core::ExceptionBridge::unwrap(result)
