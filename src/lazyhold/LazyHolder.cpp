#include <lazyhold/LazyHolder.hpp>

const char *toString(HolderState state) {
  switch (state) {
  case HolderState::UNINITIALIZED: return "UNINITIALIZED";
  case HolderState::INITIALIZING:  return "INITIALIZING";
  case HolderState::INITIALIZED:   return "INITIALIZED";
  }
  return "UNKNOWN";
}

Logger::ptr holderLogger() {
  static auto s_logger = GET_LOGGER("lazyhold.LazyHolder");
  return s_logger;
}
