#pragma once

#include <expected>
#include <string>
#include <system_error>
#include <utility>

namespace Keystone::StateManager
{

enum class StateManagerErrorCode
{
    // A property's type, and its converter's provider type if any,
    // offer no comparison capability.
    TypeNotComparable = 1,
    // A value was read as a type it does not hold.
    InvalidValueCast,
    // Two values of different types were compared, or a value does not
    // match the type of the property it was assigned to.
    ValueTypeMismatch,
    // Neither of two compared values offers a comparison capability.
    ValueNotComparable,
    // A converter's model type does not match its property's type.
    ConverterTypeMismatch,
    EntityTypeNotFound,
    PropertyNotFound,
    DuplicateName,
    InvalidEntityState,
    InvalidModelDescription,
    InvalidLiteral,
};

extern const std::error_category& StateManagerErrorCategory();

std::error_code make_error_code(
    StateManagerErrorCode errorCode
);

struct FailedResult
{
    std::error_code ErrorCode;
    std::string Message;

    operator std::error_code() const;
    operator std::unexpected<FailedResult>() const&;
    operator std::unexpected<FailedResult>()&&;

    friend bool operator ==(
        const FailedResult&,
        const FailedResult&
        ) = default;

    [[noreturn]]
    void throw_exception() const;
};

FailedResult MakeFailedResult(
    StateManagerErrorCode errorCode,
    std::string message
);

template<
    typename Result = void
>
using OperationResult = std::expected<Result, FailedResult>;

template<
    typename Result
> Result&& throw_if_failed(
    OperationResult<Result>&& operationResult
)
{
    if (!operationResult)
    {
        operationResult.error().throw_exception();
    }
    return std::move(*operationResult);
}

template<
    typename Result
> const Result& throw_if_failed(
    const OperationResult<Result>& operationResult
)
{
    if (!operationResult)
    {
        operationResult.error().throw_exception();
    }
    return *operationResult;
}

inline void throw_if_failed(
    const OperationResult<>& operationResult
)
{
    if (!operationResult)
    {
        operationResult.error().throw_exception();
    }
}

class StateManagerException : public std::exception
{
public:
    const FailedResult Result;

    explicit StateManagerException(
        FailedResult result
    ) : Result(std::move(result))
    {
    }

    std::error_code ErrorCode() const noexcept
    {
        return Result.ErrorCode;
    }

    const char* what() const noexcept override
    {
        return Result.Message.c_str();
    }
};

[[noreturn]]
void ThrowStateManagerException(
    StateManagerErrorCode errorCode,
    std::string message
);

}

namespace std
{
template<>
struct is_error_code_enum<Keystone::StateManager::StateManagerErrorCode> : true_type
{};
}
