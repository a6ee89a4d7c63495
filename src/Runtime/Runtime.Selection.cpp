module;

#include <utility>
#include <vector>
#include <entt/entity/entity.hpp>

module Runtime.Selection;

namespace Runtime::Selection
{
    namespace
    {
        void Invoke(const Callback& callback, entt::entity object)
        {
            if (!callback) return;
            Callback copy = callback;
            copy(object);
        }
    }

    bool InteractionRegistry::Add(entt::entity object, HandlerSet handlers)
    {
        auto [it, inserted] = m_Entries.insert_or_assign(object, std::move(handlers));
        (void)it;
        return inserted;
    }

    Transition InteractionRegistry::Remove(entt::entity object)
    {
        auto it = m_Entries.find(object);
        if (it == m_Entries.end())
        {
            // Keep the invariant even if a stale flag slipped through.
            m_Selected.erase(object);
            return Transition::None;
        }

        const Callback onDeselect = it->second.OnDeselect;
        const bool wasSelected = m_Selected.erase(object) > 0;

        // The handler runs while the entry still exists; erase by key afterwards
        // since the handler may have touched the map.
        if (wasSelected)
            Invoke(onDeselect, object);
        m_Entries.erase(object);

        return wasSelected ? Transition::Deselected : Transition::None;
    }

    Transition InteractionRegistry::Apply(entt::entity object, bool isIntersected)
    {
        const auto it = m_Entries.find(object);
        if (it == m_Entries.end())
            return Transition::None;

        const bool isSelected = m_Selected.contains(object);

        if (isIntersected && !isSelected)
        {
            m_Selected.insert(object);
            Invoke(it->second.OnSelect, object);
            return Transition::Selected;
        }

        if (!isIntersected && isSelected)
        {
            m_Selected.erase(object);
            Invoke(it->second.OnDeselect, object);
            return Transition::Deselected;
        }

        return Transition::None;
    }

    bool InteractionRegistry::InvokeAction(entt::entity object)
    {
        const auto it = m_Entries.find(object);
        if (it == m_Entries.end() || !it->second.OnAction)
            return false;

        Invoke(it->second.OnAction, object);
        return true;
    }

    bool InteractionRegistry::Contains(entt::entity object) const
    {
        return m_Entries.contains(object);
    }

    bool InteractionRegistry::IsSelected(entt::entity object) const
    {
        return m_Selected.contains(object);
    }

    const HandlerSet* InteractionRegistry::Handlers(entt::entity object) const
    {
        const auto it = m_Entries.find(object);
        return it != m_Entries.end() ? &it->second : nullptr;
    }

    std::vector<entt::entity> InteractionRegistry::Objects() const
    {
        std::vector<entt::entity> out;
        out.reserve(m_Entries.size());
        for (const auto& [object, handlers] : m_Entries)
            out.push_back(object);
        return out;
    }

    std::vector<entt::entity> InteractionRegistry::SelectedObjects() const
    {
        return {m_Selected.begin(), m_Selected.end()};
    }
}
