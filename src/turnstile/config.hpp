//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_CONFIG_HPP
#define TURNSTILE_CONFIG_HPP

#if __cplusplus < 201703L
#error Turnstile requires C++17 or later!
#endif

// Turnstile is header-only unless built with TSTILE_HEADER_ONLY=0, in which case exactly one translation
// unit must include the `*_impl.hpp` headers.
//
#ifndef TSTILE_HEADER_ONLY
#define TSTILE_HEADER_ONLY 1
#endif

#if TSTILE_HEADER_ONLY
#define TSTILE_INLINE_IMPL inline
#else
#define TSTILE_INLINE_IMPL
#endif

// Define TSTILE_GLOG_AVAILABLE to send log output and failed checks to Google Log (GLOG).  The CMake
// build defines it automatically when glog is found.

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Warning suppression around third-party headers (GCC only; clang does not need it).
//
#define TSTILE_DO_PRAGMA(x) _Pragma(#x)

#if defined(__GNUC__) && !defined(__clang__)
#define TSTILE_SUPPRESS_IF_GCC(warn_id) _Pragma("GCC diagnostic push") TSTILE_DO_PRAGMA(GCC diagnostic ignored warn_id)
#define TSTILE_UNSUPPRESS_IF_GCC() _Pragma("GCC diagnostic pop")
#else
#define TSTILE_SUPPRESS_IF_GCC(warn_id)
#define TSTILE_UNSUPPRESS_IF_GCC()
#endif

#endif  // TURNSTILE_CONFIG_HPP
