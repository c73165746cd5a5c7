#pragma once
#include <confluence/version.hpp>

#include <confluence/core/log.hpp>
#include <confluence/core/subscription.hpp>
#include <confluence/core/composite_subscription.hpp>
#include <confluence/core/observable.hpp>
#include <confluence/core/scheduler.hpp>
#include <confluence/core/clock.hpp>
#include <confluence/core/subject.hpp>
#include <confluence/core/record.hpp>

#include <confluence/ops/map.hpp>
#include <confluence/ops/filter.hpp>
#include <confluence/ops/aggregate.hpp>
#include <confluence/ops/last.hpp>
#include <confluence/ops/timestamp.hpp>
#include <confluence/ops/timeout.hpp>
#include <confluence/ops/combine_latest.hpp>

#include <confluence/ops/fork_join.hpp>
#include <confluence/ops/combine_latest_on_left.hpp>

#include <confluence/ops/where.hpp>
#include <confluence/ops/wrap_as.hpp>
#include <confluence/ops/append_as.hpp>
#include <confluence/ops/convert_property.hpp>
#include <confluence/ops/select_property.hpp>
#include <confluence/ops/select_as.hpp>
