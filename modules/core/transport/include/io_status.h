#pragma once

namespace ferry {

// Outcome of a blocking read on a transport session or stream.
enum class IoStatus {
    Ok,
    Timeout,
    Eof,     // peer finished cleanly
    Closed,  // locally closed or the link failed
};

} // namespace ferry
