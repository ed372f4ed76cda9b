#pragma once

namespace rf::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
