#include "Keystone.StateManager/Errors.h"

namespace Keystone::StateManager
{

namespace
{
class StateManagerErrorCategoryImpl : public std::error_category
{
public:
    const char* name() const noexcept override
    {
        return "Keystone.StateManager";
    }

    std::string message(
        int errorValue
    ) const override
    {
        switch (static_cast<StateManagerErrorCode>(errorValue))
        {
        case StateManagerErrorCode::TypeNotComparable:
            return "Type not comparable";
        case StateManagerErrorCode::InvalidValueCast:
            return "Invalid value cast";
        case StateManagerErrorCode::ValueTypeMismatch:
            return "Value type mismatch";
        case StateManagerErrorCode::ValueNotComparable:
            return "Value not comparable";
        case StateManagerErrorCode::ConverterTypeMismatch:
            return "Converter type mismatch";
        case StateManagerErrorCode::EntityTypeNotFound:
            return "Entity type not found";
        case StateManagerErrorCode::PropertyNotFound:
            return "Property not found";
        case StateManagerErrorCode::DuplicateName:
            return "Duplicate name";
        case StateManagerErrorCode::InvalidEntityState:
            return "Invalid entity state";
        case StateManagerErrorCode::InvalidModelDescription:
            return "Invalid model description";
        case StateManagerErrorCode::InvalidLiteral:
            return "Invalid literal";
        }
        return "Unknown error";
    }
};
}

const std::error_category& StateManagerErrorCategory()
{
    static const StateManagerErrorCategoryImpl category;
    return category;
}

std::error_code make_error_code(
    StateManagerErrorCode errorCode)
{
    return std::error_code(
        static_cast<int>(errorCode),
        StateManagerErrorCategory());
}

FailedResult::operator std::error_code() const
{
    return ErrorCode;
}

FailedResult::operator std::unexpected<FailedResult>() const&
{
    return std::unexpected{ *this };
}

FailedResult::operator std::unexpected<FailedResult>()&&
{
    return std::unexpected{ std::move(*this) };
}

void FailedResult::throw_exception() const
{
    throw StateManagerException(*this);
}

FailedResult MakeFailedResult(
    StateManagerErrorCode errorCode,
    std::string message)
{
    return FailedResult
    {
        .ErrorCode = make_error_code(errorCode),
        .Message = std::move(message),
    };
}

void ThrowStateManagerException(
    StateManagerErrorCode errorCode,
    std::string message)
{
    MakeFailedResult(
        errorCode,
        std::move(message)
    ).throw_exception();
}

}
