#include "Keystone.StateManager/ModelDescriptionLoader.h"
#include "Keystone.StateManager/Logging.h"
#include "Keystone.StateManager/ModelBuilder.h"
#include <fstream>
#include <sstream>
#include <fmt/format.h>
#include <google/protobuf/io/tokenizer.h>
#include <google/protobuf/text_format.h>

namespace Keystone::StateManager
{

namespace
{
std::unexpected<FailedResult> MakeUnexpected(
    StateManagerErrorCode errorCode,
    std::string message)
{
    return std::unexpected
    {
        MakeFailedResult(
            errorCode,
            std::move(message)),
    };
}

class TextFormatErrorCollector : public google::protobuf::io::ErrorCollector
{
    std::string m_errors;

public:
    void AddError(
        int line,
        google::protobuf::io::ColumnNumber column,
        const std::string& message
    ) override
    {
        if (!m_errors.empty())
        {
            m_errors += "; ";
        }
        m_errors += fmt::format("{}:{}: {}", line + 1, column + 1, message);
    }

    const std::string& Errors() const
    {
        return m_errors;
    }
};

template<
    typename TMessage
> OperationResult<TMessage> ParseTextFormat(
    std::string_view text)
{
    TMessage message;
    TextFormatErrorCollector errorCollector;

    google::protobuf::TextFormat::Parser parser;
    parser.RecordErrorsTo(&errorCollector);

    if (!parser.ParseFromString(std::string(text), &message))
    {
        return MakeUnexpected(
            StateManagerErrorCode::InvalidModelDescription,
            fmt::format(
                "Invalid {}: {}",
                TMessage::descriptor()->name(),
                errorCollector.Errors()));
    }

    return message;
}

OperationResult<std::string> ReadFile(
    const std::filesystem::path& path)
{
    std::ifstream stream(path);
    if (!stream)
    {
        return MakeUnexpected(
            StateManagerErrorCode::InvalidModelDescription,
            fmt::format("Cannot read {}", path.string()));
    }

    std::ostringstream contents;
    contents << stream.rdbuf();
    return contents.str();
}

OperationResult<> ApplyLogLevel(
    const std::string& logLevel)
{
    if (logLevel.empty())
    {
        return {};
    }

    auto level = spdlog::level::from_str(logLevel);
    if (level == spdlog::level::off && logLevel != "off")
    {
        return MakeUnexpected(
            StateManagerErrorCode::InvalidModelDescription,
            fmt::format("Unknown log level {}", logLevel));
    }

    Logging::SetLevel(level);
    return {};
}

EntityState ToEntityState(
    Serialization::EntityStateDescription state)
{
    switch (state)
    {
    case Serialization::ENTITY_STATE_ADDED:
        return EntityState::Added;
    case Serialization::ENTITY_STATE_MODIFIED:
        return EntityState::Modified;
    case Serialization::ENTITY_STATE_DELETED:
        return EntityState::Deleted;
    default:
        return EntityState::Unchanged;
    }
}
}

ModelDescriptionLoader::ModelDescriptionLoader(
    const ValueTypeRegistry& valueTypes,
    const ValueConverterRegistry& valueConverters)
    :
    m_valueTypes(valueTypes),
    m_valueConverters(valueConverters)
{}

OperationResult<std::shared_ptr<const Model>> ModelDescriptionLoader::LoadModel(
    const Serialization::ModelDescription& modelDescription
) const
{
    if (auto result = ApplyLogLevel(modelDescription.options().log_level()); !result)
    {
        return std::unexpected{ std::move(result.error()) };
    }

    ModelBuilder modelBuilder;

    for (const auto& entityTypeDescription : modelDescription.entity_types())
    {
        if (entityTypeDescription.name().empty())
        {
            return MakeUnexpected(
                StateManagerErrorCode::InvalidModelDescription,
                "An entity type has no name");
        }

        auto& entityTypeBuilder = modelBuilder.AddEntity(entityTypeDescription.name());

        for (const auto& propertyDescription : entityTypeDescription.properties())
        {
            auto typeName = propertyDescription.type();
            if (propertyDescription.nullable())
            {
                typeName += "?";
            }

            auto valueType = m_valueTypes.FindType(typeName);
            if (!valueType)
            {
                return MakeUnexpected(
                    StateManagerErrorCode::InvalidModelDescription,
                    fmt::format(
                        "Unknown type {} of {}.{}",
                        typeName,
                        entityTypeDescription.name(),
                        propertyDescription.name()));
            }

            auto& propertyBuilder = entityTypeBuilder.Property(
                propertyDescription.name(),
                valueType);

            if (!propertyDescription.converter().empty())
            {
                auto converter = m_valueConverters.Find(propertyDescription.converter());
                if (!converter)
                {
                    return MakeUnexpected(
                        StateManagerErrorCode::InvalidModelDescription,
                        fmt::format(
                            "Unknown converter {} of {}.{}",
                            propertyDescription.converter(),
                            entityTypeDescription.name(),
                            propertyDescription.name()));
                }

                propertyBuilder.HasConversion(std::move(converter));
            }
        }

        if (!entityTypeDescription.key_properties().empty())
        {
            entityTypeBuilder.HasKey(std::vector<std::string>(
                entityTypeDescription.key_properties().begin(),
                entityTypeDescription.key_properties().end()));
        }
    }

    try
    {
        return modelBuilder.FinalizeModel(
            ModelOptions
            {
                .ValidateKeyComparers = modelDescription.options().validate_key_comparers(),
            });
    }
    catch (const StateManagerException& exception)
    {
        return std::unexpected{ exception.Result };
    }
}

OperationResult<std::shared_ptr<const Model>> ModelDescriptionLoader::ParseModel(
    std::string_view text
) const
{
    auto modelDescription = ParseTextFormat<Serialization::ModelDescription>(text);
    if (!modelDescription)
    {
        return std::unexpected{ std::move(modelDescription.error()) };
    }

    return LoadModel(*modelDescription);
}

OperationResult<std::shared_ptr<const Model>> ModelDescriptionLoader::LoadModelFile(
    const std::filesystem::path& path
) const
{
    auto text = ReadFile(path);
    if (!text)
    {
        return std::unexpected{ std::move(text.error()) };
    }

    return ParseModel(*text);
}

OperationResult<> ModelDescriptionLoader::LoadEntries(
    StateManager& stateManager,
    const Serialization::EntrySetDescription& entrySetDescription
) const
{
    const auto& model = stateManager.GetModel();

    for (const auto& entryDescription : entrySetDescription.entries())
    {
        auto entityType = model.FindEntityType(entryDescription.entity_type());
        if (!entityType)
        {
            return MakeUnexpected(
                StateManagerErrorCode::EntityTypeNotFound,
                fmt::format("Entity type {} not found", entryDescription.entity_type()));
        }

        std::vector<Value> values(entityType->GetProperties().size());

        for (const auto& valueDescription : entryDescription.values())
        {
            auto property = entityType->FindProperty(valueDescription.property());
            if (!property)
            {
                return MakeUnexpected(
                    StateManagerErrorCode::PropertyNotFound,
                    fmt::format(
                        "Property {}.{} not found",
                        entityType->Name(),
                        valueDescription.property()));
            }

            if (valueDescription.value_case() != Serialization::PropertyValueDescription::kLiteral)
            {
                continue;
            }

            auto value = m_valueTypes.ParseLiteral(
                property->Type(),
                valueDescription.literal());
            if (!value)
            {
                return std::unexpected{ std::move(value.error()) };
            }

            values[property->Index()] = std::move(*value);
        }

        try
        {
            stateManager.StartTracking(
                *entityType,
                std::move(values),
                ToEntityState(entryDescription.state()));
        }
        catch (const StateManagerException& exception)
        {
            return std::unexpected{ exception.Result };
        }
    }

    return {};
}

OperationResult<> ModelDescriptionLoader::ParseEntries(
    StateManager& stateManager,
    std::string_view text
) const
{
    auto entrySetDescription = ParseTextFormat<Serialization::EntrySetDescription>(text);
    if (!entrySetDescription)
    {
        return std::unexpected{ std::move(entrySetDescription.error()) };
    }

    return LoadEntries(
        stateManager,
        *entrySetDescription);
}

OperationResult<> ModelDescriptionLoader::LoadEntriesFile(
    StateManager& stateManager,
    const std::filesystem::path& path
) const
{
    auto text = ReadFile(path);
    if (!text)
    {
        return std::unexpected{ std::move(text.error()) };
    }

    return ParseEntries(
        stateManager,
        *text);
}

}
