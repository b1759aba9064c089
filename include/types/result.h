#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <fmt/format.h>
#include "types/base.h"
#include "types/error_catalog.h"

namespace llink
{
    /**
     * Structured error carried by a failed Result
     */
    struct ErrorInfo
    {
        LLINK_ERROR_CODE code = LLINK_ERROR_CODE::UNKNOWN_ERROR;
        std::string message;
        std::string recoveryHint; // Empty when no hint applies
        std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

        ErrorCategory category() const noexcept { return categoryOf(code); }
        std::string codeName() const { return errorCodeName(code); }
        bool hasRecoveryHint() const noexcept { return !recoveryHint.empty(); }

        /**
         * Build an error from the catalog, formatting its message template with args
         */
        template <typename... Args>
        static ErrorInfo fromCode(LLINK_ERROR_CODE code, const Args &...args)
        {
            const auto &desc = describeError(code);
            ErrorInfo info;
            info.code = code;
            info.recoveryHint = desc.recoveryHint;
            if constexpr (sizeof...(args) > 0)
            {
                try
                {
                    info.message = fmt::format(fmt::runtime(desc.messageTemplate), args...);
                }
                catch (const fmt::format_error &)
                {
                    info.message = desc.messageTemplate;
                }
            }
            else
            {
                info.message = desc.messageTemplate;
            }
            return info;
        }

        /**
         * Build an error with a caller supplied message and the catalog hint
         */
        static ErrorInfo withMessage(LLINK_ERROR_CODE code, std::string message)
        {
            ErrorInfo info;
            info.code = code;
            info.message = std::move(message);
            info.recoveryHint = describeError(code).recoveryHint;
            return info;
        }
    };

    /**
     * Result of an operation: either a value or an ErrorInfo, never both
     */
    template <typename T = std::monostate>
    class Result
    {
    public:
        using value_type = T;

        // Static factory method - Success with data
        static Result<T> Ok(T val)
        {
            Result<T> r;
            r.data_ = std::move(val);
            return r;
        }

        // Static factory method - Success without data (default constructed value)
        static Result<T> Success()
        {
            return Ok(T{});
        }

        // Static factory method - Error from an existing error, forwarded unchanged
        static Result<T> Error(ErrorInfo error)
        {
            Result<T> r;
            r.error_ = std::move(error);
            return r;
        }

        // Static factory method - Error from the catalog
        template <typename... Args>
        static Result<T> Error(LLINK_ERROR_CODE code, const Args &...args)
        {
            return Error(ErrorInfo::fromCode(code, args...));
        }

        // Static factory method - Error with a custom message
        static Result<T> ErrorMessage(LLINK_ERROR_CODE code, std::string message)
        {
            return Error(ErrorInfo::withMessage(code, std::move(message)));
        }

        bool isSuccess() const noexcept { return data_.has_value(); }
        bool isError() const noexcept { return error_.has_value(); }
        bool hasValue() const noexcept { return data_.has_value(); }

        LLINK_ERROR_CODE code() const noexcept
        {
            return error_ ? error_->code : LLINK_ERROR_CODE::SUCCESS;
        }

        // Error message or "ok" on success
        std::string message() const
        {
            return error_ ? error_->message : std::string("ok");
        }

        const ErrorInfo &error() const & { return error_.value(); }
        ErrorInfo &&error() && { return std::move(error_).value(); }

        const T &value() const & { return data_.value(); }
        T &value() & { return data_.value(); }
        T &&value() && { return std::move(data_).value(); }

        template <typename U = T>
        T valueOr(U &&defaultValue) const &
        {
            return data_.value_or(std::forward<U>(defaultValue));
        }

        template <typename U = T>
        T valueOr(U &&defaultValue) &&
        {
            return std::move(data_).value_or(std::forward<U>(defaultValue));
        }

        // Functional programming support - map operation
        template <typename F>
        auto map(F &&func) const -> Result<std::invoke_result_t<F, const T &>>
        {
            using R = std::invoke_result_t<F, const T &>;
            if (isError())
            {
                return Result<R>::Error(*error_);
            }
            return Result<R>::Ok(func(*data_));
        }

        // Functional programming support - flatMap operation
        template <typename F>
        auto flatMap(F &&func) const -> std::invoke_result_t<F, const T &>
        {
            using R = std::invoke_result_t<F, const T &>;
            if (isError())
            {
                return R::Error(*error_);
            }
            return func(*data_);
        }

        template <typename F>
        const Result<T> &ifSuccess(F &&func) const
        {
            if (data_)
            {
                func(*data_);
            }
            return *this;
        }

        template <typename F>
        const Result<T> &ifError(F &&func) const
        {
            if (error_)
            {
                func(*error_);
            }
            return *this;
        }

    private:
        Result() = default;

        std::optional<T> data_;
        std::optional<ErrorInfo> error_;
    };

    // Type alias for better readability
    using VoidResult = Result<std::monostate>;
} // namespace llink
