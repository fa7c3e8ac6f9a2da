export module RHI;

export import :Types;
export import :Pass;
export import :Bindings;
export import :RenderContext;
export import :Recording;
