export module ECS:Components;

export import :Components.NameTag;
