export module Kernel;

export import :Handle;
export import :Geometry;
export import :Topology;
export import :Stores;
export import :Validation;
export import :Shape;
export import :Export;
