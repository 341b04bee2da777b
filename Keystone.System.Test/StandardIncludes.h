#pragma once

#include <gtest/gtest.h>
#include "Keystone.System/concepts.h"
#include "Keystone.System/ordering.h"
