export module Graphics;

export import :Camera;
