#include "Utility.h"

int DumpEntries(
    const string& modelPath,
    const string& entriesPath,
    StateManagerDebugStringOptions options,
    ostream& output)
{
    ModelDescriptionLoader loader;
    auto model = loader.LoadModelFile(modelPath);
    if (!model)
    {
        return ReportFailure(model.error());
    }

    StateManager stateManager(*model);
    if (auto result = loader.LoadEntriesFile(stateManager, entriesPath); !result)
    {
        return ReportFailure(result.error());
    }

    output << stateManager.ToDebugString(options);
    return 0;
}
