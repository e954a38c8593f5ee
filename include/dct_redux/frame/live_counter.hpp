#pragma once

#include "dct_redux/core/types.hpp"

namespace dct_redux::frame {

// Number of frame objects of `role` currently alive in the process.
int live_count(FrameRole role);

// Scope token counted against one role's live-frame counter. Every token,
// including copies, counts once until it is destroyed. Counters are atomic.
class LiveFrameToken {
public:
    explicit LiveFrameToken(FrameRole role);
    LiveFrameToken(const LiveFrameToken& other);
    LiveFrameToken& operator=(const LiveFrameToken& other);
    ~LiveFrameToken();

    FrameRole role() const { return role_; }

private:
    FrameRole role_;
};

} // namespace dct_redux::frame
