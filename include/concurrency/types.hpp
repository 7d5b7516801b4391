#pragma once

#include "sort/model/CopyOutcome.hpp"

typedef fsort::sort::model::CopyOutcome ExpectedFuture;
