module;

#include <coopmod/config.hpp>

module coopmod.io.io_context;

#ifdef COOPMOD_HAS_EPOLL
import coopmod.io.platform.epoll;
#endif

import std;

namespace coopmod {

auto make_io_context() -> std::unique_ptr<io_context> {
#ifdef COOPMOD_HAS_EPOLL
    return std::make_unique<epoll_context>();
#else
    throw std::runtime_error("make_io_context: platform not implemented");
#endif
}

} // namespace coopmod
