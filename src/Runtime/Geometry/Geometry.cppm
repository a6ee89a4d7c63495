export module Geometry;

export import :Primitives;
export import :Validation;
export import :Raycast;
