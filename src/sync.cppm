/// coopmod.sync — cooperative concurrency module aggregate
/// One import brings every primitive:
///   completion / lock / retry / join / deque / wait_group / default_map

export module coopmod.sync;

export import coopmod.sync.completion;
export import coopmod.sync.lock;
export import coopmod.sync.retry;
export import coopmod.sync.join;
export import coopmod.sync.deque;
export import coopmod.sync.wait_group;
export import coopmod.utils.default_map;
