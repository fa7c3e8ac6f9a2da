export module Graphics;

export import :Pipeline;
export import :Draw;
export import :Camera;
export import :RenderGraph;
export import :DrawState;
export import :Passes.Main;
