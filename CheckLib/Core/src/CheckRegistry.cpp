//=============================================================================
// CheckRegistry.cpp
//=============================================================================
#include "CheckRegistry.hpp"

#include <iostream>
#include <utility>

#include "Check.hpp"
#include "CoreUtilities.hpp"

bool CheckRegistry::registerCheck(const CheckInfo& info, const CreateFunc& createFunc)
{
    Entry entry;
    entry.info = info;

    if (info.id.empty())
    {
        std::cerr << "CheckRegistry::registerCheck(): empty check id ignored\n";
        return false;
    }

    if (createFunc)
        entry.check = createFunc();

    if (!entry.check)
    {
        entry.fault = "No check instance could be created for '" + info.id + "'";
    }
    else if (entry.check->kind() != info.declaredKind)
    {
        entry.fault = "Check '" + info.id + "' is declared as " + resultKindName(info.declaredKind) +
                      " but produces " + resultKindName(entry.check->kind());
    }

    if (!entry.fault.empty())
        std::cerr << "CheckRegistry::registerCheck(): " << entry.fault << "\n";

    const bool valid = entry.valid();

    if (!m_entries.contains(info.id))
        m_order.push_back(info.id);

    m_entries[info.id] = std::move(entry);
    return valid;
}

const CheckRegistry::Entry* CheckRegistry::find(const std::string& id) const noexcept
{
    if (auto it = m_entries.find(id); it != m_entries.end())
        return &it->second;

    return nullptr;
}

const CheckRegistry::Entry& CheckRegistry::get(const std::string& id) const
{
    if (const Entry* entry = find(id))
        return *entry;

    throw un::core_exception("Check \"" + id + "\" not found");
}

bool CheckRegistry::contains(const std::string& id) const noexcept
{
    return m_entries.contains(id);
}
