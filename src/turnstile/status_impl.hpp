//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_STATUS_IMPL_HPP
#define TURNSTILE_STATUS_IMPL_HPP

#include <turnstile/config.hpp>
//
#include <algorithm>

namespace tstile {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL std::string_view detail::StatusCodeTable::message(int value) const noexcept
{
    const auto iter = std::find_if(this->codes.begin(), this->codes.end(), [value](const auto& entry) {
        return entry.first == value;
    });
    if (iter == this->codes.end()) {
        return "(unregistered status code)";
    }
    return iter->second;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL detail::StatusCodeTable detail::builtin_status_code_table()
{
    return StatusCodeTable{
        "tstile::StatusCode",
        {
            {0, "Ok"},
            {1, "Cancelled"},
            {2, "Unknown"},
            {3, "Invalid Argument"},
            {4, "Deadline Exceeded"},
            {5, "Not Found"},
            {6, "Already Exists"},
            {7, "Permission Denied"},
            {8, "Resource Exhausted"},
            {9, "Failed Precondition"},
            {10, "Aborted"},
            {11, "Out of Range"},
            {12, "Unimplemented"},
            {13, "Internal"},
            {14, "Unavailable"},
            {15, "Data Loss"},
            {16, "Unauthenticated"},
        },
    };
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL std::ostream& operator<<(std::ostream& out, const Status& t)
{
    return out << t.message() << " (" << t.type_name() << "=" << t.code() << ")";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL Status OkStatus()
{
    return Status{};
}

}  // namespace tstile

#endif  // TURNSTILE_STATUS_IMPL_HPP
