#pragma once
#include <map>
#include <string>

// materials carried by a robot or handed to a base, in kg per material name
struct Inventory
{
    std::map<std::string, float> materials;

    float total() const
    {
        float sum = 0.0f;
        for (const auto &[material, kg] : materials)
        {
            sum += kg;
        }
        return sum;
    }

    float amountOf(const std::string &material) const
    {
        auto it = materials.find(material);
        return it != materials.end() ? it->second : 0.0f;
    }

    bool empty() const { return materials.empty(); }
    void clear() { materials.clear(); }
};
