module;
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <entt/entity/registry.hpp>

export module Graphics:Camera;

export namespace ECS::Camera
{
    struct Component
    {
        // Name under which this camera can become active (e.g. "Camera3d").
        std::optional<std::string> Name{};
    };
}

export namespace ECS::VisibleEntities
{
    struct VisibleEntity
    {
        entt::entity Entity = entt::null;
        float Order = 0.0f;
    };

    // Filled upstream by visibility determination. Iteration order is draw order.
    struct Component
    {
        std::vector<VisibleEntity> Value{};

        [[nodiscard]] auto begin() const { return Value.begin(); }
        [[nodiscard]] auto end() const { return Value.end(); }
        [[nodiscard]] size_t Size() const { return Value.size(); }
        [[nodiscard]] bool Empty() const { return Value.empty(); }
    };
}

export namespace Graphics
{
    // -------------------------------------------------------------------------
    // ActiveCameras
    // -------------------------------------------------------------------------
    // Registry of camera names to the entity currently rendering under that
    // name. A registered name may be unbound (no active camera this frame).
    class ActiveCameras
    {
    public:
        // Register a name. Existing bindings are kept.
        void Add(std::string_view name);

        // Bind a name to an entity, registering the name if needed.
        void Set(std::string_view name, entt::entity entity);

        // Unbind a name, keeping it registered.
        void Reset(std::string_view name);

        // Bound entity for a name, or empty if the name is unknown or unbound.
        [[nodiscard]] std::optional<entt::entity> Get(std::string_view name) const;

        [[nodiscard]] bool IsRegistered(std::string_view name) const;
        [[nodiscard]] std::vector<std::string> GetNames() const;

    private:
        std::unordered_map<std::string, std::optional<entt::entity>> m_Cameras;
    };

    // Binds every registered, unbound name to a camera entity carrying
    // that name, and unbinds names whose entity no longer qualifies.
    void UpdateActiveCameras(const entt::registry& registry, ActiveCameras& activeCameras);
}
