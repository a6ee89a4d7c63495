module;
#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <entt/entity/entity.hpp>

export module Runtime.Selection;

export namespace Runtime::Selection
{
    using Callback = std::function<void(entt::entity)>;

    // Per-object notification channel. Empty members are simply not invoked.
    struct HandlerSet
    {
        Callback OnSelect;
        Callback OnDeselect;
        Callback OnAction; // Fired by input code on an activation gesture, never by Update().
    };

    enum class Transition : uint8_t
    {
        None = 0,
        Selected = 1,
        Deselected = 2,
    };

    // Interactive objects and their selection flags.
    // Invariants:
    //  - Every selected entity is registered.
    //  - Handler callbacks fire exactly once per transition.
    // Callbacks may re-enter (e.g. remove their own object); they are copied
    // before invocation so erasing the entry mid-call is safe.
    class InteractionRegistry
    {
    public:
        // Returns true if 'object' was not registered before. Re-registration
        // replaces the handler set and keeps the selection flag.
        bool Add(entt::entity object, HandlerSet handlers = {});

        // Drops 'object'. If it was selected, OnDeselect fires before the entry
        // is erased and the call returns Transition::Deselected.
        // Unregistered objects are ignored.
        Transition Remove(entt::entity object);

        // One step of the per-object state machine: compares the current
        // intersection result with the stored flag and fires the matching handler.
        Transition Apply(entt::entity object, bool isIntersected);

        // Invokes OnAction if 'object' is registered and has one.
        bool InvokeAction(entt::entity object);

        [[nodiscard]] bool Contains(entt::entity object) const;
        [[nodiscard]] bool IsSelected(entt::entity object) const;
        [[nodiscard]] const HandlerSet* Handlers(entt::entity object) const;

        [[nodiscard]] size_t Count() const { return m_Entries.size(); }
        [[nodiscard]] size_t SelectedCount() const { return m_Selected.size(); }

        // Snapshots; safe to iterate while handlers mutate the registry.
        [[nodiscard]] std::vector<entt::entity> Objects() const;
        [[nodiscard]] std::vector<entt::entity> SelectedObjects() const;

    private:
        std::unordered_map<entt::entity, HandlerSet> m_Entries;
        std::unordered_set<entt::entity> m_Selected;
    };
}
