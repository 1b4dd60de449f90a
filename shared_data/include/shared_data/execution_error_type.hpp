#pragma once

#include <shared_data/shared_data.hpp>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(
        ExecutionErrorType,
        Timeout,
        Cancelled,
        SpawnFailure,
        AuthKeyRejected,
        AuthPermissionDenied,
        HostKeyVerificationFailed,
        IdentityFileMissing,
        ConnectionRefused,
        ConnectionTimedOut,
        NoRouteToHost,
        HostnameUnresolvable,
        NetworkUnreachable,
        RemotePathNotFound,
        RemotePathIsDirectory,
        RemotePathNotADirectory,
        RemotePermissionDenied,
        NoSpaceLeft,
        DiskQuotaExceeded,
        Unclassified);
}
