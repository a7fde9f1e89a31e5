/// coopmod.io — event loop module aggregate
///   io_context (post / schedule_after / run) + make_io_context()

export module coopmod.io;

export import coopmod.io.io_context;
