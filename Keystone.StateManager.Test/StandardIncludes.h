#pragma once

#include <gtest/gtest.h>
#include "Keystone.StateManager/Keystone.StateManager.h"
#include "TestTypes.h"

namespace Keystone::StateManager
{

// Run an action expected to throw StateManagerException
// and return the exception's error code.
template<
    typename TAction
> std::error_code GetStateManagerErrorCode(
    TAction&& action)
{
    try
    {
        action();
    }
    catch (const StateManagerException& exception)
    {
        return exception.ErrorCode();
    }
    return {};
}

}
