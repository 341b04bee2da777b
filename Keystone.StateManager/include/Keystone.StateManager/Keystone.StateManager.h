// Keystone.StateManager.h : Include file for the public interface
// of the state manager.

#pragma once

#include "Primitives.h"
#include "Errors.h"
#include "Value.h"
#include "ValueComparer.h"
#include "EntityEntry.h"
#include "CurrentValueComparer.h"
#include "ValueType.h"
#include "ValueConverter.h"
#include "Model.h"
#include "ModelBuilder.h"
#include "CurrentValueComparerFactory.h"
#include "EntryOrdering.h"
#include "StateManager.h"
#include "Registries.h"
#include "Logging.h"
