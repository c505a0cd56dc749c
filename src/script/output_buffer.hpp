#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace warden::script {

// Fixed-capacity text sink. Writes past capacity are dropped and the buffer
// is marked truncated.
class BoundedBuffer {
public:
    explicit BoundedBuffer(std::size_t capacity);

    void Append(std::string_view text);

    const std::string& contents() const { return contents_; }
    bool truncated() const { return truncated_; }
    std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    std::string contents_;
    bool truncated_ = false;
};

}  // namespace warden::script
