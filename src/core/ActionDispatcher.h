/*
 * ActionDispatcher.h
 *
 * Purpose:
 *   Declares the executor seam for event start/end actions.
 *   Event definitions carry opaque action strings; the host decides what they mean.
 */

#pragma once

#include <string>

class ActionDispatcher {
public:
    virtual ~ActionDispatcher() = default;

    // Executes one action line. Failures are the dispatcher's to log; they never abort the caller.
    virtual void dispatch(const std::string& action) = 0;
};
