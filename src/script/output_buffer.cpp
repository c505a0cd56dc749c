#include "script/output_buffer.hpp"

namespace warden::script {

BoundedBuffer::BoundedBuffer(std::size_t capacity) : capacity_(capacity) {
    contents_.reserve(capacity_);
}

void BoundedBuffer::Append(std::string_view text) {
    if (truncated_) {
        return;
    }
    const std::size_t room = capacity_ - contents_.size();
    if (text.size() > room) {
        contents_.append(text.substr(0, room));
        truncated_ = true;
        return;
    }
    contents_.append(text);
}

}  // namespace warden::script
