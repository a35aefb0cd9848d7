export module Core;

// Re-export all sub-systems so the user only needs 'import Core;'
export import Core.Logging;
export import Core.Error;
