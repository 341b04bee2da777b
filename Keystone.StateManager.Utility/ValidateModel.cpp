#include "Utility.h"

int ValidateModel(
    const string& modelPath,
    ostream& output)
{
    ModelDescriptionLoader loader;
    auto model = loader.LoadModelFile(modelPath);
    if (!model)
    {
        return ReportFailure(model.error());
    }

    int exitCode = 0;

    for (auto entityType : (*model)->GetEntityTypes())
    {
        output << entityType->Name() << "\n";

        for (auto property : entityType->GetProperties())
        {
            output << "  " << property->Name() << " (" << property->Type()->Name() << ")";
            if (property->IsPrimaryKey())
            {
                output << " PK";
            }

            auto comparer = CurrentValueComparerFactory::TryCreate(*property);
            if (comparer)
            {
                output << ": " << ToString((*comparer)->Kind()) << "\n";
                continue;
            }

            output << ": " << comparer.error().Message << "\n";
            if (property->IsPrimaryKey())
            {
                exitCode = 1;
            }
        }
    }

    return exitCode;
}
