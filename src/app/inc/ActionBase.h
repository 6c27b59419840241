#pragma once

#include "ParameterContext.h"

class ActionBase {
public:
    virtual ~ActionBase() = default;
    virtual void execute() = 0;
};
