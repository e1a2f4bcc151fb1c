#pragma once
/**
 * @file handler.hpp
 * @brief Consumer of interception start/completion notifications.
 * @details Both calls run on the interceptor's serial queue: keep them short
 *          and non-blocking, and copy whatever must outlive the call.
 */

#include "beacon/interception/task_interception.hpp"

namespace beacon::interception {

    class InterceptionHandler {
    public:
        virtual ~InterceptionHandler() = default;

        /// A task was observed starting; metrics and completion are still empty.
        virtual void notify_interception_started(const TaskInterception& interception) = 0;

        /// Metrics and completion were both received; the record is gone after this call.
        virtual void notify_interception_completed(const TaskInterception& interception) = 0;
    };

} // namespace beacon::interception
