#include "MaterialStockpile.h"
#include <iomanip>
#include <iostream>

void MaterialStockpile::deposit(const Inventory &inventory)
{
    for (const auto &[material, kg] : inventory.materials)
    {
        totals_.materials[material] += kg;
    }
    depositCount_++;
}

void MaterialStockpile::clear()
{
    totals_.clear();
    depositCount_ = 0;
}

void MaterialStockpile::printStatistics() const
{
    std::cout << "=== Stockpile ===" << std::endl;
    std::cout << "Deposits: " << depositCount_ << std::endl;
    for (const auto &[material, kg] : totals_.materials)
    {
        std::cout << "  " << std::setw(12) << std::left << material
                  << std::fixed << std::setprecision(1) << kg << " kg" << std::endl;
    }
    std::cout << "Total: " << std::fixed << std::setprecision(1) << totals_.total() << " kg" << std::endl;
}
