//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_LOGGING_HPP
#define TURNSTILE_LOGGING_HPP

#include <turnstile/config.hpp>

// Gate and wait-loop events are logged with TSTILE_VLOG(1) (state changes, failures) and TSTILE_VLOG(2)
// (construction); run with `--v=1` under glog to see them.  Without glog, logging compiles away.
//
#ifdef TSTILE_GLOG_AVAILABLE

#include <glog/logging.h>

#define TSTILE_VLOG VLOG

#else  // ==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

#include <iostream>

#define TSTILE_LOG_DISABLED(...)                                                                             \
    if (false)                                                                                               \
    std::cerr

#define TSTILE_VLOG TSTILE_LOG_DISABLED

#endif  // TSTILE_GLOG_AVAILABLE

#endif  // TURNSTILE_LOGGING_HPP
