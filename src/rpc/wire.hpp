// SPDX-License-Identifier: Apache-2.0
// Status mapping between the document wire protocol and ErrorCode.
#pragma once

#include "common/errors.hpp"
#include "document.pb.h"

namespace firetick::rpc {

using WireStatus = firetick::v1::DocResponse::Status;

inline ErrorCode from_wire(WireStatus st)
{
    switch (st) {
        case firetick::v1::DocResponse::OK:
        case firetick::v1::DocResponse::STREAM_END:
            return ErrorCode::none;
        case firetick::v1::DocResponse::NOT_FOUND:
            return ErrorCode::not_found;
        case firetick::v1::DocResponse::UNAUTHENTICATED:
            return ErrorCode::unauthenticated;
        case firetick::v1::DocResponse::INVALID_ARGUMENT:
            return ErrorCode::invalid_path;
        default:
            return ErrorCode::transient_rpc_failure;
    }
}

inline WireStatus to_wire(ErrorCode code)
{
    switch (code) {
        case ErrorCode::none:
            return firetick::v1::DocResponse::OK;
        case ErrorCode::not_found:
            return firetick::v1::DocResponse::NOT_FOUND;
        case ErrorCode::unauthenticated:
            return firetick::v1::DocResponse::UNAUTHENTICATED;
        case ErrorCode::invalid_path:
            return firetick::v1::DocResponse::INVALID_ARGUMENT;
        default:
            return firetick::v1::DocResponse::INTERNAL;
    }
}

} // namespace firetick::rpc
