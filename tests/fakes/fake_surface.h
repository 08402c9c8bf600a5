// fake_surface.h
#pragma once

#include <csignal>
#include <deque>
#include <string>
#include <vector>

#include "surface.h"

namespace mdtodo {
namespace test {

// --------------------------------------------------------------------
// Surface that replays a fixed key script and records every frame.
// When the script runs out it raises the interrupt flag, if one was given,
// and otherwise answers "q".
// --------------------------------------------------------------------
class FakeSurface : public Surface {
public:
    explicit FakeSurface(std::vector<std::string> keys,
                         volatile std::sig_atomic_t* interruptWhenDone = nullptr)
        : keys_(keys.begin(), keys.end()), interruptWhenDone_(interruptWhenDone) {}

    void draw(const ScreenModel& model) override { frames.push_back(model); }

    std::optional<std::string> pollKey(std::chrono::milliseconds) override {
        if (keys_.empty()) {
            if (interruptWhenDone_) {
                *interruptWhenDone_ = 1;
                return std::nullopt;
            }
            return std::string("q");
        }
        std::string key = keys_.front();
        keys_.pop_front();
        return key;
    }

    std::vector<ScreenModel> frames;

private:
    std::deque<std::string> keys_;
    volatile std::sig_atomic_t* interruptWhenDone_;
};

} // namespace test
} // namespace mdtodo
