#include "Utility.h"

void PrintUsage()
{
    cout <<
        "Keystone.StateManager.Utility: \n"
        "    ValidateModel <model>\n"
        "    DumpEntries <model> <entries> [long]\n";
}

int main(
    int argn,
    char** argv)
{
    deque<string> args(
        argv,
        argv + argn);

    args.pop_front();

    if (args.empty())
    {
        PrintUsage();
        return 0;
    }

    auto arg = args.front();
    args.pop_front();

    if (arg == "ValidateModel")
    {
        if (args.empty())
        {
            PrintUsage();
            return 0;
        }

        return ValidateModel(
            args.front());
    }

    if (arg == "DumpEntries")
    {
        if (args.size() < 2)
        {
            PrintUsage();
            return 0;
        }

        auto modelPath = args.front();
        args.pop_front();
        auto entriesPath = args.front();
        args.pop_front();

        auto options = !args.empty() && args.front() == "long"
            ? StateManagerDebugStringOptions::LongDefault
            : StateManagerDebugStringOptions::ShortDefault;

        return DumpEntries(
            modelPath,
            entriesPath,
            options);
    }

    PrintUsage();
    return 0;
}
