#pragma once

#include "hid_report.hpp"

class PointerSource {
public:
    virtual ~PointerSource() = default;

    // Current absolute position and button state. Must not block.
    virtual PointerSample sample() = 0;
};
