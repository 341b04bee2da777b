#pragma once

#include <filesystem>
#include <memory>
#include <string_view>
#include "Keystone.StateManager/ModelDescription.pb.h"
#include "Errors.h"
#include "Model.h"
#include "Registries.h"
#include "StateManager.h"

namespace Keystone::StateManager
{

// Builds models and tracked entries from protocol buffers text format
// descriptions, resolving type and converter names through registries.
class ModelDescriptionLoader
{
    const ValueTypeRegistry& m_valueTypes;
    const ValueConverterRegistry& m_valueConverters;

public:
    explicit ModelDescriptionLoader(
        const ValueTypeRegistry& valueTypes = ValueTypeRegistry::Default(),
        const ValueConverterRegistry& valueConverters = ValueConverterRegistry::Default());

    OperationResult<std::shared_ptr<const Model>> LoadModel(
        const Serialization::ModelDescription& modelDescription
    ) const;

    OperationResult<std::shared_ptr<const Model>> ParseModel(
        std::string_view text
    ) const;

    OperationResult<std::shared_ptr<const Model>> LoadModelFile(
        const std::filesystem::path& path
    ) const;

    // Start tracking the described entries. On failure, the entries
    // before the failing one remain tracked.
    OperationResult<> LoadEntries(
        StateManager& stateManager,
        const Serialization::EntrySetDescription& entrySetDescription
    ) const;

    OperationResult<> ParseEntries(
        StateManager& stateManager,
        std::string_view text
    ) const;

    OperationResult<> LoadEntriesFile(
        StateManager& stateManager,
        const std::filesystem::path& path
    ) const;
};

}
