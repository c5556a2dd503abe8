//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_ASYNC_COMPLETION_GATE_HPP
#define TURNSTILE_ASYNC_COMPLETION_GATE_HPP

#include <turnstile/config.hpp>

#include "completion_gate_decl.hpp"

#if TSTILE_HEADER_ONLY
#include "completion_gate_impl.hpp"
#endif

#endif  // TURNSTILE_ASYNC_COMPLETION_GATE_HPP
