#ifndef ECS_HPP
#define ECS_HPP

#include "ecs_events.hpp"
#include <algorithm>
#include <unordered_map>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <queue>
#include <tuple>
#include <vector>
#include <stdexcept>
#include <string>
#include <typeinfo>

using Entity = uint32_t;
constexpr Entity NULL_ENTITY = 0;

class IComponent {
public:
    virtual ~IComponent() = default;
};

class IComponentArray {
public:
    virtual ~IComponentArray() = default;
    virtual void AddComponent(Entity entity, std::unique_ptr<IComponent> component) = 0;
    virtual void RemoveComponent(Entity entity) = 0;
    virtual IComponent* GetComponent(Entity entity) = 0;
    virtual bool HasComponent(Entity entity) const = 0;
    virtual size_t Size() const = 0;
};

template<typename T>
class ComponentArray : public IComponentArray {
    static_assert(std::is_base_of<IComponent, T>::value, "ComponentArray<T>: T must derive from IComponent");
    // unique_ptr storage keeps component addresses stable while the map grows
    std::unordered_map<Entity, std::unique_ptr<T>> components;

    friend class EntityManager;
public:
    void AddComponent(Entity entity, std::unique_ptr<IComponent> component) override {
        if (!component) throw std::invalid_argument("AddComponent: null component");
        T* derived = dynamic_cast<T*>(component.get());
        if (!derived) throw std::invalid_argument("AddComponent: component type mismatch");

        components[entity] = std::unique_ptr<T>(static_cast<T*>(component.release()));
    }

    void RemoveComponent(Entity entity) override {
        components.erase(entity);
    }

    IComponent* GetComponent(Entity entity) override {
        return GetTyped(entity);
    }

    T* GetTyped(Entity entity) {
        auto it = components.find(entity);
        return (it != components.end()) ? it->second.get() : nullptr;
    }

    bool HasComponent(Entity entity) const override {
        return components.find(entity) != components.end();
    }

    size_t Size() const override {
        return components.size();
    }
};


class EntityManager {
    std::unordered_map<std::type_index, std::unique_ptr<IComponentArray>> componentArrays;
    std::vector<bool> activeEntities;
    std::queue<Entity> availableEntityIds;
    std::queue<Entity> entitiesToDestroy;
    std::vector<Entity> creationOrder;  // live entities, oldest first
    Entity nextEntityId = 1; // 0 is NULL_ENTITY
    size_t entityCount = 0;

public:
    Entity CreateEntity() {
        Entity entityId;

        if (!availableEntityIds.empty()) {
            entityId = availableEntityIds.front();
            availableEntityIds.pop();
            activeEntities[entityId] = true;
        } else {
            entityId = nextEntityId++;
            if (entityId >= activeEntities.size()) {
                activeEntities.resize(entityId + 1, false);
            }
            activeEntities[entityId] = true;
        }

        creationOrder.push_back(entityId);
        entityCount++;
        return entityId;
    }

    // Destruction is deferred until FlushDestroyedEntities so that queries
    // in flight keep seeing valid components.
    void DestroyEntity(Entity entity) {
        if (IsEntityValid(entity)) {
            entitiesToDestroy.push(entity);
        }
    }

    void FlushDestroyedEntities() {
        while (!entitiesToDestroy.empty()) {
            Entity entity = entitiesToDestroy.front();
            entitiesToDestroy.pop();
            if (!IsEntityValid(entity)) {
                continue;
            }

            for (auto& [typeIndex, componentArray] : componentArrays) {
                if (componentArray->HasComponent(entity)) {
                    componentArray->RemoveComponent(entity);
                }
            }

            activeEntities[entity] = false;
            creationOrder.erase(std::find(creationOrder.begin(), creationOrder.end(), entity));
            availableEntityIds.push(entity);
            entityCount--;
        }
    }

    bool IsEntityValid(Entity entity) const {
        return entity != NULL_ENTITY &&
               entity < activeEntities.size() &&
               activeEntities[entity];
    }

    size_t GetEntityCount() const {
        return entityCount;
    }

    template<typename T>
    void RegisterComponentType() {
        std::type_index typeIndex(typeid(T));
        if (componentArrays.find(typeIndex) != componentArrays.end()) {
            throw std::invalid_argument("Component type already registered");
        }
        componentArrays[typeIndex] = std::make_unique<ComponentArray<T>>();
    }

    template<typename T, typename... Args>
    T* AddComponent(Entity entity, Args&&... args) {
        if (!IsEntityValid(entity)) {
            return nullptr;
        }

        auto* componentArray = GetArray<T>();
        if (!componentArray) {
            throw std::invalid_argument(std::string("Component type not registered: ") + typeid(T).name());
        }

        componentArray->AddComponent(entity, std::make_unique<T>(std::forward<Args>(args)...));
        return componentArray->GetTyped(entity);
    }

    template<typename T>
    T* GetComponent(Entity entity) {
        if (!IsEntityValid(entity)) {
            return nullptr;
        }

        auto* componentArray = GetArray<T>();
        return componentArray ? componentArray->GetTyped(entity) : nullptr;
    }

    template<typename T>
    bool HasComponent(Entity entity) const {
        if (!IsEntityValid(entity)) {
            return false;
        }

        auto it = componentArrays.find(std::type_index(typeid(T)));
        if (it == componentArrays.end()) {
            return false;
        }

        return it->second->HasComponent(entity);
    }

    // Query builder for filtering entities by components. Iteration order is
    // creation order (oldest first); entities created after the first begin() are not
    // visited by that query.
    template<typename... Components>
    class Query {
        EntityManager* manager;
        std::vector<Entity> cachedEntities;
        bool cacheDirty = true;

    public:
        explicit Query(EntityManager* mgr) : manager(mgr) {}

        class Iterator {
            EntityManager* manager;
            std::vector<Entity>::const_iterator entityIt;

        public:
            Iterator(EntityManager* mgr, std::vector<Entity>::const_iterator it)
                : manager(mgr), entityIt(it) {}

            // Entity first, then component pointers
            std::tuple<Entity, Components*...> operator*() const {
                Entity entity = *entityIt;
                return std::make_tuple(entity, manager->GetComponent<Components>(entity)...);
            }

            Entity GetEntity() const {
                return *entityIt;
            }

            Iterator& operator++() {
                ++entityIt;
                return *this;
            }

            bool operator!=(const Iterator& other) const {
                return entityIt != other.entityIt;
            }
        };

        Iterator begin() {
            if (cacheDirty) {
                UpdateCache();
            }
            return Iterator(manager, cachedEntities.cbegin());
        }

        Iterator end() {
            if (cacheDirty) {
                UpdateCache();
            }
            return Iterator(manager, cachedEntities.cend());
        }

        size_t Count() {
            if (cacheDirty) {
                UpdateCache();
            }
            return cachedEntities.size();
        }

    private:
        void UpdateCache() {
            cachedEntities.clear();

            for (Entity entity : manager->creationOrder) {
                if ((manager->HasComponent<Components>(entity) && ...)) {
                    cachedEntities.push_back(entity);
                }
            }

            cacheDirty = false;
        }
    };

    template<typename... Components>
    Query<Components...> CreateQuery() {
        return Query<Components...>(this);
    }

private:
    template<typename T>
    ComponentArray<T>* GetArray() {
        auto it = componentArrays.find(std::type_index(typeid(T)));
        if (it == componentArrays.end()) {
            return nullptr;
        }
        return static_cast<ComponentArray<T>*>(it->second.get());
    }
};

class ISystem {
public:
    virtual ~ISystem() = default;
    virtual void Update(EntityManager& entityManager, std::vector<EventEntry>& events, float deltaTime) = 0;
};

class ECSWorld {
    EntityManager entityManager;
    std::vector<std::unique_ptr<ISystem>> systems;
    std::vector<EventEntry> events;

public:
    EntityManager& GetEntityManager() {
        return entityManager;
    }

    void AddSystem(std::unique_ptr<ISystem> system) {
        systems.push_back(std::move(system));
    }

    // Systems run in registration order.
    void Update(float deltaTime) {
        for (auto& system : systems) {
            system->Update(entityManager, events, deltaTime);
        }
    }

    std::vector<EventEntry>& GetEvents() {
        return events;
    }

    void ClearEvents() {
        events.clear();
    }
};

// Removes every entity queued with DestroyEntity during this update.
class DestroyingSystem : public ISystem {
public:
    void Update(EntityManager& entityManager, std::vector<EventEntry>&, float) override {
        entityManager.FlushDestroyedEntities();
    }
};

#endif // ECS_HPP
