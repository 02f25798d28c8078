#include "storage/value.hpp"

#include "common/time.hpp"

#include <algorithm>
#include <utility>

namespace zephyrite {

ValueMetadata ValueMetadata::create(std::size_t size, const std::string& timestamp) {
    return ValueMetadata{size, timestamp, timestamp};
}

Value Value::create(std::string content, const std::string& timestamp) {
    const auto size = content.size();
    return Value{std::move(content), ValueMetadata::create(size, timestamp)};
}

Value Value::create(std::string content) {
    return create(std::move(content), current_timestamp());
}

Value Value::replaced_by(std::string new_content, const std::string& timestamp) const {
    Value next = create(std::move(new_content), timestamp);
    next.metadata.created_at = metadata.created_at;
    // Replayed or skewed clocks must not produce updated_at < created_at.
    next.metadata.updated_at = std::max(timestamp, metadata.created_at);
    return next;
}

} // namespace zephyrite
