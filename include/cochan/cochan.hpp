#ifndef COCHAN_COCHAN_HPP
#define COCHAN_COCHAN_HPP

#include "allocator.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "scheduler.hpp"
#include "select.hpp"
#include "shared_state.hpp"
#include "sleep.hpp"
#include "task.hpp"
#include "task_id.hpp"
#include "yield.hpp"

#endif // COCHAN_COCHAN_HPP
