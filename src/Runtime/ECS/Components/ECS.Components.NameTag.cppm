module;
#include <string>

export module ECS:Components.NameTag;

export namespace ECS::Components::NameTag
{
    // Human-readable entity name, used by diagnostics.
    struct Component
    {
        std::string Name;
    };
}
