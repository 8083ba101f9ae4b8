#pragma once
#include <QtGlobal>

enum class ErrorKind : quint8 {
    InvalidInput,      // 400
    NotFound,          // 404
    MethodNotAllowed,  // 405
    Unavailable,       // 500  backend unreachable
    Timeout,           // 504
    Upstream,          // backend-reported, status passed through
    Internal           // 500
};

enum class StreamState : quint8 {
    Streaming, Done
};

enum class StreamEnd : quint8 {
    Completed,   // terminal frame seen, sentinel written
    Truncated    // backend closed the body before a terminal frame
};
