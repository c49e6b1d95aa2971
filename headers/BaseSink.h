#pragma once
#include "Inventory.h"

// where robots hand over their load when they reach base
class BaseSink
{
public:
    virtual ~BaseSink() = default;

    // always accepts the whole inventory
    virtual void deposit(const Inventory &inventory) = 0;
};
