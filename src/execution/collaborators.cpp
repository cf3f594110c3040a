#include <stakeline/execution/collaborators.hpp>

#include <chrono>

namespace stakeline::execution {

clock_source_t system_clock_source() {
  return []() {
    return static_cast<stakeline::schema::timestamp_seconds_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

}  // namespace stakeline::execution
