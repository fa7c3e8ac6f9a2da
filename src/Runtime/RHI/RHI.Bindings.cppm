module;
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

export module RHI:Bindings;

import :Types;

export namespace RHI
{
    // -------------------------------------------------------------------------
    // RenderResourceBindings
    // -------------------------------------------------------------------------
    // Frame-global named resources (camera uniforms, shared samplers, ...)
    // handed to the backend when a pass begins. Read-only while passes record.
    class RenderResourceBindings
    {
    public:
        void Set(std::string_view name, RenderResourceId resource)
        {
            m_Bindings.insert_or_assign(std::string(name), resource);
        }

        [[nodiscard]] std::optional<RenderResourceId> Get(std::string_view name) const
        {
            if (auto it = m_Bindings.find(std::string(name)); it != m_Bindings.end())
                return it->second;
            return std::nullopt;
        }

        void Remove(std::string_view name) { m_Bindings.erase(std::string(name)); }
        void Clear() { m_Bindings.clear(); }

        [[nodiscard]] size_t Size() const { return m_Bindings.size(); }
        [[nodiscard]] bool Empty() const { return m_Bindings.empty(); }

    private:
        std::unordered_map<std::string, RenderResourceId> m_Bindings;
    };
}
