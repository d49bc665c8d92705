// cyclecc.hpp：对外的汇总头文件
#pragma once

#include "Trace/Trace.hpp"
#include "Trace/TraceStd.hpp"
#include "Trace/Traceable.hpp"
#include "Trace/ThreadShareable.hpp"
#include "Collector/Cc.hpp"
#include "Collector/ObjectSpace.hpp"
#include "Collector/ThreadedObjectSpace.hpp"
