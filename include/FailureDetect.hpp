#pragma once

// Marker files in the log directory record how the previous run ended.
namespace FailureDetect
{
    bool MarkFailure();
    bool MarkSuccess();
    bool WasLastSuccess();
    bool WasLastFailure();
}
