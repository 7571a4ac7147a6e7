export module Core;

// Re-export all sub-systems so the user only needs 'import Core;'
export import :Handle;
export import :Error;
export import :Logging;
export import :Store;
