#include "dct_redux/frame/live_counter.hpp"

#include <array>
#include <atomic>

namespace dct_redux::frame {

namespace {

std::array<std::atomic<int>, 3> g_live_frames{};

std::atomic<int>& counter_for(FrameRole role) {
    return g_live_frames[static_cast<size_t>(role)];
}

} // namespace

int live_count(FrameRole role) {
    return counter_for(role).load();
}

LiveFrameToken::LiveFrameToken(FrameRole role) : role_(role) {
    counter_for(role_).fetch_add(1);
}

LiveFrameToken::LiveFrameToken(const LiveFrameToken& other) : role_(other.role_) {
    counter_for(role_).fetch_add(1);
}

LiveFrameToken& LiveFrameToken::operator=(const LiveFrameToken& other) {
    if (role_ != other.role_) {
        counter_for(role_).fetch_sub(1);
        role_ = other.role_;
        counter_for(role_).fetch_add(1);
    }
    return *this;
}

LiveFrameToken::~LiveFrameToken() {
    counter_for(role_).fetch_sub(1);
}

} // namespace dct_redux::frame
