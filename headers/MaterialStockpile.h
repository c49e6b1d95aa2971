#pragma once
#include <string>
#include "BaseSink.h"
#include "Inventory.h"

// the factory's material store, filled by robots unloading at the dock
class MaterialStockpile : public BaseSink
{
public:
    void deposit(const Inventory &inventory) override;

    float amountOf(const std::string &material) const { return totals_.amountOf(material); }
    float total() const { return totals_.total(); }
    const Inventory &getTotals() const { return totals_; }
    int getDepositCount() const { return depositCount_; }

    void clear();
    void printStatistics() const;

private:
    Inventory totals_;
    int depositCount_ = 0;
};
