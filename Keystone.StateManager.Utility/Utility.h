#pragma once

#include "Keystone.StateManager/Keystone.StateManager.h"
#include "Keystone.StateManager/ModelDescriptionLoader.h"
#include <deque>
#include <iostream>
#include <string>

using namespace std;
using namespace Keystone::StateManager;

int ValidateModel(
    const string& modelPath,
    ostream& output = cout);

int DumpEntries(
    const string& modelPath,
    const string& entriesPath,
    StateManagerDebugStringOptions options,
    ostream& output = cout);

int ReportFailure(
    const FailedResult& failedResult);
