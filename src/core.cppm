/// coopmod.core — core module aggregate
///   error (errc / coop_category / is_interrupted) / log

export module coopmod.core;

export import coopmod.core.error;
export import coopmod.core.log;
